#pragma once

#include "concurrency/AsyncService.hpp"
#include "tasks/Context.hpp"

#include <memory>

namespace ovdm::sched {

// Keeps the cruise and lowering directory sizes in the tracker's size cache fresh.
class SizeCacher final : public concurrency::AsyncService {
public:
    explicit SizeCacher(std::shared_ptr<tasks::Context> ctx);
    ~SizeCacher() override;

    types::SizeSnapshot refresh() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<tasks::Context> ctx_;
};

}
