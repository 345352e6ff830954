#pragma once

#include "concurrency/Job.hpp"
#include "tasks/Context.hpp"

#include <memory>

namespace ovdm::tasks {

class StopJob {
public:
    explicit StopJob(std::shared_ptr<Context> ctx);

    concurrency::JobResult operator()(const concurrency::Job& job) const;

private:
    std::shared_ptr<Context> ctx_;
};

}
