#pragma once

#include "concurrency/Job.hpp"
#include "tasks/Context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ovdm::tasks {

// Worker side of a Run: claim, test, plan, copy, post-process, finish.
class RunTransfer {
public:
    explicit RunTransfer(std::shared_ptr<Context> ctx);

    concurrency::JobResult operator()(const concurrency::Job& job) const;

private:
    std::shared_ptr<Context> ctx_;

    concurrency::JobResult execute(unsigned int id, const cancel::Token& token) const;

    // Resolves the tracker and shapes the job result; only successful outcomes fan out to hooks.
    concurrency::JobResult conclude(unsigned int id, types::LastResult::Outcome outcome, const std::string& reason,
                                    std::vector<std::string> warnings = {},
                                    nlohmann::json data = nlohmann::json::object()) const;

    // Pull-only work after the copy: mirror deletions, ownership, transfer logs.
    void finishPull(const filter::ResolvedTransfer& transfer, const types::Plan& plan, std::time_t startedAt,
                    types::CopyResult& copy, std::vector<std::string>& warnings) const;
};

}
