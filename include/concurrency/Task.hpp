#pragma once

#include "concurrency/Job.hpp"

#include <future>
#include <optional>
#include <stdexcept>

namespace ovdm::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Optional future for reporting
    virtual std::optional<std::future<JobResult>> getFuture() { return std::nullopt; }
};

struct PromisedTask : Task {
    std::promise<JobResult> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<JobResult> p) : promise(std::move(p)) {}

    std::optional<std::future<JobResult>> getFuture() override { return promise.get_future(); }

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }
};

}
