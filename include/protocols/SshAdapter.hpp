#pragma once

#include "protocols/Adapter.hpp"

#include <map>

namespace ovdm::protocols {

// rsync over ssh, authenticated by key or by sshpass with the password in the environment.
class SshAdapter final : public Adapter {
public:
    using Adapter::Adapter;

    types::TestReport test() override;
    std::vector<types::FileEntry> enumerate() override;
    types::CopyResult copy(const types::Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) override;

private:
    [[nodiscard]] bool passwordAuth() const { return !target_.credentials.use_ssh_key; }
    [[nodiscard]] std::string host() const;
    [[nodiscard]] std::vector<std::string> sshOptions() const;
    [[nodiscard]] std::vector<std::string> wrapper() const;
    [[nodiscard]] std::map<std::string, std::string> env() const;

    process::Result remote(const std::string& command) const;
};

}
