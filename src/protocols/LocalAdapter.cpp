#include "protocols/LocalAdapter.hpp"
#include "protocols/RsyncCommand.hpp"
#include "util/TempDir.hpp"
#include "util/files.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::types;

TestReport LocalAdapter::test() {
    TestReport report;

    const bool pull = target_.pull();
    const std::string side = pull ? "Source directory" : "Destination directory";
    const std::string& dir = target_.remoteDir();
    const bool writeTest = !pull || target_.remove_source_files;

    std::vector<std::string> rest;
    if (target_.local_dir_is_mount_point) rest.push_back(side + " is a mountpoint");
    if (writeTest) rest.emplace_back("Write test");

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        const auto reason = fmt::format("Unable to find {}: {} on the Data Warehouse", pull ? "source directory" : "destination directory", dir);
        report.fail(side, reason);
        failRemaining(report, rest, reason);
        return report;
    }
    report.pass(side);

    if (target_.local_dir_is_mount_point) {
        if (!util::isMountPoint(dir)) {
            const auto reason = fmt::format("{}: {} is not a mountpoint on the Data Warehouse", side, dir);
            report.fail(side + " is a mountpoint", reason);
            if (writeTest) report.fail("Write test", reason);
            return report;
        }
        report.pass(side + " is a mountpoint");
    }

    if (writeTest) {
        if (!util::canWrite(dir)) report.fail("Write test", "Unable to write to " + dir);
        else report.pass("Write test");
    }

    return report;
}

std::vector<FileEntry> LocalAdapter::enumerate() {
    return enumerateLocal(target_.source_dir);
}

CopyResult LocalAdapter::copy(const Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) {
    if (plan.empty() && !target_.sync_to_dest) return {};

    std::error_code ec;
    fs::create_directories(target_.dest_dir, ec);
    if (ec) {
        CopyResult out;
        out.status = CopyResult::Status::Fatal;
        out.error = "Unable to create destination directory " + target_.dest_dir + ": " + ec.message();
        return out;
    }

    util::TempDir scratch("ovdm-local");
    RsyncCommand cmd(target_.source_dir + "/", target_.dest_dir);
    cmd.bandwidth(limit)
        .removeSourceFiles(target_.remove_source_files)
        .skipEmptyDirs(target_.skip_empty_dirs)
        .skipEmptyFiles(target_.skip_empty_files)
        .deleteExtraneous(target_.sync_to_dest)
        .filesFrom(writeFileList(plan, scratch.path()));

    return runRsync(cmd, plan, onSpawn);
}
