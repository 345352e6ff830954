#include "sched/Enqueuer.hpp"
#include "log/Registry.hpp"

using namespace ovdm::sched;
using namespace ovdm::types;
using namespace ovdm::log;

Enqueuer::Enqueuer(std::shared_ptr<tasks::Context> ctx, std::shared_ptr<concurrency::JobQueue> queue)
    : ctx_(std::move(ctx)), queue_(std::move(queue)) {
    if (!ctx_ || !queue_) throw std::invalid_argument("Enqueuer requires a task context and a job queue");
}

EnqueueResult Enqueuer::enqueue(const unsigned int id, const std::time_t now) const {
    const auto def = ctx_->store->definition(id);
    if (!def) return {EnqueueStatus::NotFound, "", "Unknown transfer definition " + std::to_string(id)};
    return enqueue(*def, ctx_->store->voyageContext(), now);
}

EnqueueResult Enqueuer::enqueue(const TransferDefinition& def, const VoyageContext& voyage, const std::time_t now) const {
    if (!voyage.system_on) return {EnqueueStatus::Disabled, "", "System status is Off"};
    if (!def.enable) return {EnqueueStatus::Disabled, "", def.name + " is disabled"};

    try {
        (void)tasks::resolve(*ctx_, def, voyage, now);
    } catch (const filter::ContextUnavailable& e) {
        Registry::sched()->debug("[Enqueuer] {}: {}", def.name, e.what());
        return {EnqueueStatus::ContextUnavailable, "", e.what()};
    } catch (const filter::ConfigurationError& e) {
        Registry::sched()->warn("[Enqueuer] {}: {}", def.name, e.what());
        return {EnqueueStatus::ConfigurationError, "", e.what()};
    }

    switch (ctx_->tracker->tryStart(def.id)) {
        case state::StartResult::NotFound: return {EnqueueStatus::NotFound, "", "Unknown transfer definition " + std::to_string(def.id)};
        case state::StartResult::AlreadyRunning: return {EnqueueStatus::AlreadyRunning, "", def.name + " is already in progress"};
        case state::StartResult::Ok: break;
    }

    const auto kind = concurrency::runTaskFor(def.category);
    try {
        const auto handle = queue_->submit(kind, {{"id", def.id}}, def.id);
        Registry::sched()->info("[Enqueuer] {} queued as {}", def.name, handle);
        return {EnqueueStatus::Queued, handle, ""};
    } catch (const std::exception& e) {
        // Hand the definition back; nothing will ever claim this job.
        ctx_->tracker->requestStop(def.id);
        Registry::sched()->error("[Enqueuer] Could not queue {}: {}", def.name, e.what());
        throw;
    }
}

std::string ovdm::sched::to_string(const EnqueueStatus status) {
    switch (status) {
        case EnqueueStatus::Queued: return "queued";
        case EnqueueStatus::AlreadyRunning: return "already_running";
        case EnqueueStatus::ContextUnavailable: return "context_unavailable";
        case EnqueueStatus::ConfigurationError: return "configuration_error";
        case EnqueueStatus::NotFound: return "not_found";
        case EnqueueStatus::Disabled: return "disabled";
        default: throw std::invalid_argument("Unknown enqueue status");
    }
}
