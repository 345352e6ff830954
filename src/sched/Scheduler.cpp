#include "sched/Scheduler.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace ovdm::sched;
using namespace ovdm::types;
using namespace ovdm::log;

Scheduler::Scheduler(std::shared_ptr<tasks::Context> ctx, std::shared_ptr<Enqueuer> enqueuer)
    : AsyncService("Scheduler"), ctx_(std::move(ctx)), enqueuer_(std::move(enqueuer)) {}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::eligible(const TransferDefinition& def, const VoyageContext& voyage) const {
    if (!def.enable) return false;

    const auto& cfg = ctx_->config.scheduler;
    if (def.category == Category::CollectionSystem) {
        if (def.cruise_or_lowering == Scope::Lowering && !voyage.loweringActive()) return false;
    } else if (!cfg.include_outbound) {
        return false;
    }

    const auto status = ctx_->tracker->snapshot(def.id).status;
    if (status == Status::Idle) return true;
    return status == Status::Error && cfg.retry_errored;
}

std::vector<CycleEntry> Scheduler::runCycle(const std::time_t now) const {
    std::vector<CycleEntry> out;

    const auto voyage = ctx_->store->voyageContext();
    if (!voyage.system_on) {
        Registry::sched()->debug("[Scheduler] System is Off, skipping cycle");
        return out;
    }

    for (const auto& def : ctx_->store->definitions()) {
        try {
            if (!eligible(def, voyage)) continue;
            auto result = enqueuer_->enqueue(def, voyage, now);
            if (!result.queued())
                Registry::sched()->debug("[Scheduler] {} not queued: {} {}", def.name, to_string(result.status), result.reason);
            out.push_back({def.id, std::move(result)});
        } catch (const std::exception& e) {
            Registry::sched()->error("[Scheduler] Could not schedule {}: {}", def.name, e.what());
        }
    }

    Registry::sched()->debug("[Scheduler] Cycle evaluated {} eligible definition(s)", out.size());
    return out;
}

void Scheduler::runLoop() {
    using namespace std::chrono;
    const auto& cfg = ctx_->config.scheduler;

    if (!waitFor(seconds(cfg.startup_delay_seconds))) return;

    while (!interruptFlag_.load()) {
        try {
            runCycle();
        } catch (const std::exception& e) {
            Registry::sched()->error("[Scheduler] Cycle failed: {}", e.what());
        }
        if (!waitFor(minutes(cfg.transfer_interval_minutes))) break;
    }
}
