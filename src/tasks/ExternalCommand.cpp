#include "tasks/ExternalCommand.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace ovdm::tasks;
using namespace ovdm::concurrency;
using namespace ovdm::log;

nlohmann::json ovdm::tasks::commandBlob(const Context& ctx, const Job& job) {
    nlohmann::json blob = {
        {"task", to_string(job.kind)},
        {"voyage", ctx.store->voyageContext()},
        {"payload", job.payload}
    };
    if (job.definition_id)
        if (const auto def = ctx.store->definition(*job.definition_id)) blob["definition"] = *def;
    return blob;
}

ExternalCommand::ExternalCommand(std::shared_ptr<Context> ctx, const TaskKind kind) : ctx_(std::move(ctx)), kind_(kind) {
    if (!ctx_) throw std::invalid_argument("ExternalCommand requires a task context");
}

JobResult ExternalCommand::operator()(const Job& job) const {
    const auto name = to_string(kind_);
    const auto it = ctx_->config.task_commands.find(name);
    if (it == ctx_->config.task_commands.end() || it->second.empty()) {
        Registry::hooks()->debug("[ExternalCommand] No command configured for {}, nothing to do", name);
        return JobResult::ok({{"skipped", true}});
    }

    auto argv = it->second;
    argv.push_back(commandBlob(*ctx_, job).dump());

    Registry::hooks()->info("[ExternalCommand] {} ({}): running {}", name, job.handle, it->second.front());
    const auto res = ctx_->runner->run(argv);
    for (const auto& line : res.output) Registry::hooks()->debug("[ExternalCommand] {}: {}", name, line);

    if (!res.ok()) {
        const auto reason = res.signaled ? name + " terminated by signal " + std::to_string(res.term_signal)
                                         : name + " exited with code " + std::to_string(res.exit_code);
        Registry::hooks()->warn("[ExternalCommand] {}", reason);
        return JobResult::failed(reason, {{"exit_code", res.exit_code}});
    }

    Registry::hooks()->info("[ExternalCommand] {} ({}) completed", name, job.handle);
    return JobResult::ok({{"exit_code", 0}});
}
