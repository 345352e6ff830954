#pragma once

#include "protocols/Adapter.hpp"

#include <filesystem>
#include <optional>

namespace ovdm::protocols {

// An rsync daemon (rsync://user@server/module).
class RsyncAdapter final : public Adapter {
public:
    using Adapter::Adapter;

    types::TestReport test() override;
    std::vector<types::FileEntry> enumerate() override;
    types::CopyResult copy(const types::Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) override;

private:
    [[nodiscard]] std::string url(const std::string& path = {}) const;
    [[nodiscard]] bool anonymous() const;

    // Daemon passwords travel in a 0600 file, never on the command line.
    std::optional<std::filesystem::path> writePasswordFile(const std::filesystem::path& dir) const;

    std::vector<std::string> probe(const std::optional<std::filesystem::path>& passwordFile) const;
};

}
