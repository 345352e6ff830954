#pragma once

#include "concurrency/Job.hpp"
#include "concurrency/TaskKind.hpp"
#include "tasks/Context.hpp"

#include <map>
#include <memory>
#include <string>

namespace ovdm::tasks {

// Operator commands bound to a (task, transfer name) pair. Exit codes are logged, never propagated.
class PostHook {
public:
    PostHook(std::shared_ptr<Context> ctx, concurrency::TaskKind kind);

    concurrency::JobResult operator()(const concurrency::Job& job) const;

private:
    std::shared_ptr<Context> ctx_;
    concurrency::TaskKind kind_;
};

// Replaces each {token} in arg; tokens with an empty value are left as they are.
std::string replaceHookTokens(std::string arg, const std::map<std::string, std::string>& values);

}
