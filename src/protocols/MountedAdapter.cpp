#include "protocols/MountedAdapter.hpp"
#include "protocols/RsyncCommand.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::types;
using namespace ovdm::log;

std::vector<std::string> MountedAdapter::dirParts() const {
    std::vector<std::string> parts{target_.pull() ? "Source directory" : "Destination directory"};
    if (writable()) parts.emplace_back("Write test");
    return parts;
}

void MountedAdapter::testMountedDir(TestReport& report, const Mount& mnt, const std::string& label) const {
    const bool pull = target_.pull();
    const std::string side = pull ? "Source directory" : "Destination directory";
    const auto& dir = target_.remoteDir();
    const auto local = mnt.resolve(dir);

    std::error_code ec;
    if (!fs::is_directory(local, ec)) {
        const auto reason = fmt::format("Unable to find {}: {} on {}", pull ? "source directory" : "destination directory", dir, label);
        report.fail(side, reason);
        if (writable()) report.fail("Write test", reason);
        return;
    }
    report.pass(side);

    if (!writable()) return;
    if (util::canWrite(local)) report.pass("Write test");
    else report.fail("Write test", fmt::format("Write test failed to: {} on {}", dir, label));
}

std::vector<FileEntry> MountedAdapter::enumerate() {
    if (!target_.pull()) return enumerateLocal(target_.source_dir);

    const auto mnt = mount(false);
    if (!mnt->mounted()) throw std::runtime_error("Unable to mount source for " + target_.name + ": " + mnt->error());
    return enumerateLocal(mnt->resolve(target_.source_dir));
}

CopyResult MountedAdapter::copy(const Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) {
    if (plan.empty() && !target_.sync_to_dest) return {};

    const auto mnt = mount(writable());
    if (!mnt->mounted()) {
        CopyResult out;
        out.status = CopyResult::Status::Fatal;
        out.error = "Unable to mount share: " + mnt->error();
        return out;
    }

    const bool pull = target_.pull();
    const auto source = pull ? mnt->resolve(target_.source_dir).string() : target_.source_dir;
    const auto dest = pull ? target_.dest_dir : mnt->resolve(target_.dest_dir).string();

    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        CopyResult out;
        out.status = CopyResult::Status::Fatal;
        out.error = "Unable to create destination directory " + dest + ": " + ec.message();
        return out;
    }

    RsyncCommand cmd(source + "/", dest);
    cmd.bandwidth(limit)
        .removeSourceFiles(target_.remove_source_files)
        .skipEmptyDirs(target_.skip_empty_dirs)
        .skipEmptyFiles(target_.skip_empty_files)
        .deleteExtraneous(target_.sync_to_dest)
        .filesFrom(writeFileList(plan, mnt->scratch()));

    Registry::transfer()->info("[{}] Transferring {} item(s) through {}", target_.name, plan.include.size(), mnt->point().string());
    return runRsync(cmd, plan, onSpawn);
}
