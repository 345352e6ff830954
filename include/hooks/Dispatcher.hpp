#pragma once

#include "concurrency/JobQueue.hpp"
#include "hooks/Table.hpp"

#include <memory>

namespace ovdm::hooks {

// Enqueues follow-on jobs after a job succeeds. Installed as the queue's completion listener.
class Dispatcher {
public:
    Dispatcher(Table table, std::shared_ptr<concurrency::JobQueue> queue);

    // Follow-ons inherit the job payload merged with the "hook" object of the result data.
    void onCompleted(const concurrency::Job& job, const concurrency::JobResult& result) const;

    [[nodiscard]] const Table& table() const { return table_; }

private:
    Table table_;
    std::weak_ptr<concurrency::JobQueue> queue_;
};

}
