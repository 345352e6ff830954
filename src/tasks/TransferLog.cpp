#include "tasks/TransferLog.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

std::vector<fs::path> ovdm::tasks::writeTransferLogs(const fs::path& dir, const TransferLogEntry& entry) {
    std::vector<fs::path> written;
    fs::create_directories(dir);

    if (!entry.new_files.empty() || !entry.updated_files.empty()) {
        const auto path = dir / (entry.name + "_" + util::compactTimestamp(entry.started_at) + ".log");
        const nlohmann::json body = {{"new", entry.new_files}, {"updated", entry.updated_files}};
        util::writeFile(path, body.dump(2));
        written.push_back(path);
    }

    const auto excludePath = dir / (entry.name + "_Exclude.log");
    const nlohmann::json exclude = {{"exclude", entry.excluded}};
    util::writeFile(excludePath, exclude.dump(2));
    written.push_back(excludePath);

    return written;
}
