#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace ovdm::tasks {

struct TransferLogEntry {
    std::string name{};
    std::time_t started_at{};
    std::vector<std::string> new_files{}, updated_files{}, excluded{};
};

// Writes <name>_<stamp>.log ({new, updated}, only when something moved) and <name>_Exclude.log ({exclude})
// into dir. Returns the paths written.
std::vector<std::filesystem::path> writeTransferLogs(const std::filesystem::path& dir, const TransferLogEntry& entry);

}
