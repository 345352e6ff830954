#include "tasks/StopJob.hpp"

using namespace ovdm::tasks;
using namespace ovdm::concurrency;

StopJob::StopJob(std::shared_ptr<Context> ctx) : ctx_(std::move(ctx)) {
    if (!ctx_) throw std::invalid_argument("StopJob requires a task context");
}

JobResult StopJob::operator()(const Job& job) const {
    if (!job.definition_id) return JobResult::failed("Stop job carries no transfer definition");
    const auto result = ctx_->canceller->stop(*job.definition_id);
    return JobResult::ok({{"result", to_string(result)}});
}
