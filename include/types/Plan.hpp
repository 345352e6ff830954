#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ovdm::types {

// One candidate under a transfer's source tree, relative to the resolved source directory.
struct FileEntry {
    std::string rel_path{};
    std::uintmax_t size{0};
    std::time_t mtime{};
    bool is_dir{false};

    bool operator==(const FileEntry&) const = default;
};

struct Plan {
    std::vector<FileEntry> include{};
    std::vector<std::string> excluded{};  // names the transfer refuses to carry (non-ASCII)
    std::vector<std::string> deferred{};  // still being written, retried next run
    std::uintmax_t total_bytes{0};

    [[nodiscard]] bool empty() const { return include.empty(); }
    [[nodiscard]] std::vector<std::string> paths() const;

    bool operator==(const Plan&) const = default;
};

void to_json(nlohmann::json& j, const FileEntry& f);
void to_json(nlohmann::json& j, const Plan& p);

}
