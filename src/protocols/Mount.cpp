#include "protocols/Mount.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::log;

Mount::Mount(std::shared_ptr<process::Runner> runner)
    : runner_(std::move(runner)), scratch_("ovdm-mnt") {
    fs::create_directories(point());
    fs::permissions(point(), fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec
                                 | fs::perms::others_read | fs::perms::others_exec);
}

Mount::~Mount() {
    if (!mounted_) return;

    try {
        const auto res = runner_->run({"umount", point().string()});
        if (res.ok()) return;
        Registry::transfer()->error("[Mount] Failed to unmount {} (exit {}), leaving it in place", point().string(), res.exit_code);
    } catch (const std::exception& e) {
        Registry::transfer()->error("[Mount] Failed to unmount {}: {}", point().string(), e.what());
    }

    // Never recurse into a directory that still has a share mounted on it.
    scratch_.release();
}

bool Mount::attach(const std::vector<std::string>& argv) {
    const auto res = runner_->run(argv);
    if (res.ok()) {
        mounted_ = true;
        return true;
    }

    error_ = res.output.empty() ? "mount exited with code " + std::to_string(res.exit_code) : res.output.back();
    Registry::transfer()->warn("[Mount] {} failed: {}", argv.empty() ? "mount" : argv.front(), error_);

    // A partial mount can survive a failed mount(8) call.
    const auto cleanup = runner_->run({"umount", point().string()});
    if (cleanup.ok()) Registry::transfer()->debug("[Mount] Cleaned up partial mount on {}", point().string());
    return false;
}

fs::path Mount::resolve(const std::string& dir) const {
    auto rel = dir;
    while (rel.starts_with("/")) rel.erase(0, 1);
    return rel.empty() ? point() : point() / rel;
}
