#pragma once

#include "concurrency/Job.hpp"
#include "concurrency/TaskKind.hpp"
#include "tasks/Context.hpp"

#include <memory>

namespace ovdm::tasks {

// Runs the argv configured for a task kind with the JSON blob as the final argument. Success iff exit 0.
class ExternalCommand {
public:
    ExternalCommand(std::shared_ptr<Context> ctx, concurrency::TaskKind kind);

    concurrency::JobResult operator()(const concurrency::Job& job) const;

private:
    std::shared_ptr<Context> ctx_;
    concurrency::TaskKind kind_;
};

// {task, voyage, definition?, payload}; the definition is serialized without credentials.
nlohmann::json commandBlob(const Context& ctx, const concurrency::Job& job);

}
