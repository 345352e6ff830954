#pragma once

#include "protocols/MountedAdapter.hpp"

#include <optional>
#include <string>

namespace ovdm::protocols {

class SmbAdapter final : public MountedAdapter {
public:
    using MountedAdapter::MountedAdapter;

    types::TestReport test() override;

protected:
    std::unique_ptr<Mount> mount(bool writable) override;

private:
    std::optional<std::string> version_;

    [[nodiscard]] bool guest() const;
    [[nodiscard]] std::string unc() const;

    // "2.1", or "1.0" for servers that only speak SMB1. Empty when the server is unreachable.
    std::optional<std::string> detectVersion();
};

}
