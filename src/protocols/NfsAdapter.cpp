#include "protocols/NfsAdapter.hpp"

#include <fmt/format.h>

using namespace ovdm::protocols;
using namespace ovdm::types;

std::string NfsAdapter::exportSpec() const {
    const auto& c = target_.credentials;
    auto share = c.share;
    if (!share.starts_with("/")) share.insert(0, "/");
    return c.server + ":" + share;
}

std::unique_ptr<Mount> NfsAdapter::mount(const bool writable) {
    auto mnt = std::make_unique<Mount>(runner_);
    mnt->attach({"mount", "-t", "nfs", exportSpec(), mnt->point().string(), "-o", writable ? "rw" : "ro"});
    return mnt;
}

TestReport NfsAdapter::test() {
    TestReport report;
    const auto& server = target_.credentials.server;

    auto remaining = dirParts();
    remaining.insert(remaining.begin(), "NFS export");

    if (!runQuiet({"showmount", "-e", server}).ok()) {
        const auto reason = fmt::format("Could not reach NFS server: {}", server);
        report.fail("NFS server", reason);
        failRemaining(report, remaining, reason);
        return report;
    }
    report.pass("NFS server");

    const auto mnt = mount(writable());
    if (!mnt->mounted()) {
        failRemaining(report, remaining, fmt::format("Could not mount NFS export: {}: {}", exportSpec(), mnt->error()));
        return report;
    }
    report.pass("NFS export");

    testMountedDir(report, *mnt, "NFS export");
    return report;
}
