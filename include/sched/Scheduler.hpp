#pragma once

#include "concurrency/AsyncService.hpp"
#include "sched/Enqueuer.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace ovdm::sched {

struct CycleEntry {
    unsigned int id{};
    EnqueueResult result{};
};

// Periodic trigger: every transfer interval, enqueue each eligible definition.
class Scheduler final : public concurrency::AsyncService {
public:
    Scheduler(std::shared_ptr<tasks::Context> ctx, std::shared_ptr<Enqueuer> enqueuer);
    ~Scheduler() override;

    // One pass over every definition. Does nothing while the system is Off.
    std::vector<CycleEntry> runCycle(std::time_t now = util::now()) const;

    [[nodiscard]] bool eligible(const types::TransferDefinition& def, const types::VoyageContext& voyage) const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<tasks::Context> ctx_;
    std::shared_ptr<Enqueuer> enqueuer_;
};

}
