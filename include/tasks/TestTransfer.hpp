#pragma once

#include "concurrency/Job.hpp"
#include "tasks/Context.hpp"
#include "types/Report.hpp"

#include <memory>

namespace ovdm::tasks {

// Standalone connection test. Holds the definition like a run does, but a failure never marks it Error.
class TestTransfer {
public:
    explicit TestTransfer(std::shared_ptr<Context> ctx);

    concurrency::JobResult operator()(const concurrency::Job& job) const;

private:
    std::shared_ptr<Context> ctx_;

    types::TestReport probe(unsigned int id) const;
};

}
