#pragma once

#include "concurrency/JobQueue.hpp"
#include "tasks/Context.hpp"
#include "util/timestamp.hpp"

#include <ctime>
#include <memory>
#include <string>

namespace ovdm::sched {

enum class EnqueueStatus { Queued, AlreadyRunning, ContextUnavailable, ConfigurationError, NotFound, Disabled };

struct EnqueueResult {
    EnqueueStatus status{EnqueueStatus::NotFound};
    std::string handle{};
    std::string reason{};

    [[nodiscard]] bool queued() const { return status == EnqueueStatus::Queued; }
};

// The one path from "please run this" to a queued Run job, shared by the scheduler and manual runs.
// Resolution happens before tryStart so configuration problems never touch the definition's state.
class Enqueuer {
public:
    Enqueuer(std::shared_ptr<tasks::Context> ctx, std::shared_ptr<concurrency::JobQueue> queue);

    EnqueueResult enqueue(unsigned int id, std::time_t now = util::now()) const;

    EnqueueResult enqueue(const types::TransferDefinition& def, const types::VoyageContext& voyage,
                          std::time_t now = util::now()) const;

private:
    std::shared_ptr<tasks::Context> ctx_;
    std::shared_ptr<concurrency::JobQueue> queue_;
};

std::string to_string(EnqueueStatus status);

}
