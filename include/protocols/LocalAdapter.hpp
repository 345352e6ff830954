#pragma once

#include "protocols/Adapter.hpp"

namespace ovdm::protocols {

// A directory on the warehouse itself, usually an operator-managed mount.
class LocalAdapter final : public Adapter {
public:
    using Adapter::Adapter;

    types::TestReport test() override;
    std::vector<types::FileEntry> enumerate() override;
    types::CopyResult copy(const types::Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) override;
};

}
