#pragma once

#include "protocols/Adapter.hpp"
#include "protocols/Mount.hpp"

#include <memory>

namespace ovdm::protocols {

// Shares reached by mounting them locally (SMB, NFS); copies then run as local rsync.
class MountedAdapter : public Adapter {
public:
    using Adapter::Adapter;

    std::vector<types::FileEntry> enumerate() override;
    types::CopyResult copy(const types::Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) override;

protected:
    // The returned mount is live only if mounted() says so; error() explains why not.
    virtual std::unique_ptr<Mount> mount(bool writable) = 0;

    // Pulls only write when they remove source files.
    [[nodiscard]] bool writable() const { return !target_.pull() || target_.remove_source_files; }

    [[nodiscard]] std::vector<std::string> dirParts() const;

    // Directory and write checks against a live mount.
    void testMountedDir(types::TestReport& report, const Mount& mnt, const std::string& label) const;
};

}
