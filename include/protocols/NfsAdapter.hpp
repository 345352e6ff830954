#pragma once

#include "protocols/MountedAdapter.hpp"

namespace ovdm::protocols {

class NfsAdapter final : public MountedAdapter {
public:
    using MountedAdapter::MountedAdapter;

    types::TestReport test() override;

protected:
    std::unique_ptr<Mount> mount(bool writable) override;

private:
    [[nodiscard]] std::string exportSpec() const;
};

}
