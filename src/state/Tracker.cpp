#include "state/Tracker.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>

using namespace ovdm::state;
using namespace ovdm::types;
using namespace ovdm::log;

Tracker::Tracker(std::shared_ptr<RecordStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("Tracker requires a record store");
}

std::shared_ptr<Tracker::Entry> Tracker::entry(const TransferDefinition& def) {
    {
        std::shared_lock lock(entriesMutex_);
        if (const auto it = entries_.find(def.id); it != entries_.end()) return it->second;
    }

    std::unique_lock lock(entriesMutex_);
    auto& slot = entries_[def.id];
    if (!slot) {
        slot = std::make_shared<Entry>();
        slot->state = def.live;
        slot->prior = def.live.status;
    }
    return slot;
}

std::shared_ptr<Tracker::Entry> Tracker::entry(const unsigned int id) {
    {
        std::shared_lock lock(entriesMutex_);
        if (const auto it = entries_.find(id); it != entries_.end()) return it->second;
    }

    const auto def = store_->definition(id);
    if (!def) return nullptr;
    return entry(*def);
}

void Tracker::persist(const unsigned int id, const LiveState& state) const {
    store_->saveLiveState(id, state);
}

StartResult Tracker::tryStart(const unsigned int id) {
    const auto e = entry(id);
    if (!e) return StartResult::NotFound;

    std::scoped_lock lock(e->mutex);
    const auto status = e->state.status;
    if (status != Status::Idle && status != Status::Error) {
        Registry::state()->debug("[StateTracker] Transfer {} is {}, refusing to start", id, to_string(status));
        return StartResult::AlreadyRunning;
    }

    auto next = e->state;
    next.status = Status::Queued;
    next.pid.reset();
    persist(id, next);

    e->state = std::move(next);
    e->prior = status;
    e->token.reset();

    Registry::state()->debug("[StateTracker] Transfer {} queued", id);
    return StartResult::Ok;
}

std::shared_ptr<ovdm::cancel::Token> Tracker::claim(const unsigned int id, const int pid) {
    const auto e = entry(id);
    if (!e) return nullptr;

    std::scoped_lock lock(e->mutex);
    if (e->state.status != Status::Queued) {
        Registry::state()->info("[StateTracker] Transfer {} is {} at claim time, dropping job", id, to_string(e->state.status));
        return nullptr;
    }

    auto next = e->state;
    next.status = Status::Starting;
    next.pid = pid;
    persist(id, next);

    e->state = std::move(next);
    e->token = std::make_shared<cancel::Token>();

    Registry::state()->debug("[StateTracker] Transfer {} starting (pid {})", id, pid);
    return e->token;
}

bool Tracker::markRunning(const unsigned int id, const int pid) {
    const auto e = entry(id);
    if (!e) return false;

    std::scoped_lock lock(e->mutex);
    if (e->state.status != Status::Starting) return false;

    auto next = e->state;
    next.status = Status::Running;
    next.pid = pid;
    persist(id, next);
    e->state = std::move(next);

    Registry::state()->debug("[StateTracker] Transfer {} running (pid {})", id, pid);
    return true;
}

void Tracker::attachProcess(const unsigned int id, const std::shared_ptr<process::Handle>& handle) {
    const auto e = entry(id);
    if (!e || !handle) return;

    std::shared_ptr<cancel::Token> token;
    {
        std::scoped_lock lock(e->mutex);
        token = e->token;
        if (e->state.status == Status::Starting || e->state.status == Status::Running || e->state.status == Status::Stopping) {
            auto next = e->state;
            next.pid = handle->pid();
            try {
                persist(id, next);
                e->state = std::move(next);
            } catch (const std::exception& ex) {
                // The token still gets the handle so a stop reaches the process.
                Registry::state()->error("[StateTracker] Unable to record pid {} for transfer {}: {}", handle->pid(), id, ex.what());
            }
        }
    }

    if (token) token->attach(handle);
}

void Tracker::detachProcess(const unsigned int id) {
    const auto e = entry(id);
    if (!e) return;

    std::shared_ptr<cancel::Token> token;
    {
        std::scoped_lock lock(e->mutex);
        token = e->token;
    }
    if (token) token->detach();
}

StopResult Tracker::requestStop(const unsigned int id) {
    const auto e = entry(id);
    if (!e) throw std::invalid_argument("Unknown transfer definition: " + std::to_string(id));

    std::shared_ptr<cancel::Token> token;
    {
        std::scoped_lock lock(e->mutex);
        switch (e->state.status) {
            case Status::Queued: {
                auto next = e->state;
                next.status = e->prior;
                persist(id, next);
                e->state = std::move(next);
                Registry::state()->info("[StateTracker] Transfer {} dequeued before it started", id);
                return StopResult::Dequeued;
            }
            case Status::Starting:
            case Status::Running:
            case Status::Stopping: {
                if (!e->state.pid) return StopResult::NotRunning;
                auto next = e->state;
                next.status = Status::Stopping;
                persist(id, next);
                e->state = std::move(next);
                token = e->token;
                break;
            }
            default:
                return StopResult::NotRunning;
        }
    }

    // Signal outside the entry lock; the worker may be calling back into the tracker.
    if (token) token->cancel();
    Registry::state()->info("[StateTracker] Transfer {} stopping", id);
    return StopResult::Stopping;
}

void Tracker::finish(const unsigned int id, const LastResult::Outcome outcome,
                     std::string reason, std::vector<std::string> warnings) {
    const auto e = entry(id);
    if (!e) throw std::invalid_argument("Unknown transfer definition: " + std::to_string(id));

    std::scoped_lock lock(e->mutex);

    auto next = e->state;
    switch (outcome) {
        case LastResult::Outcome::Success:
        case LastResult::Outcome::SuccessWithWarnings:
        case LastResult::Outcome::Cancelled:
        case LastResult::Outcome::TestPassed:
            next.status = Status::Idle;
            break;
        case LastResult::Outcome::Failure:
            next.status = Status::Error;
            break;
        case LastResult::Outcome::TestFailed:
        case LastResult::Outcome::Skipped:
            next.status = e->prior;
            break;
        default:
            throw std::invalid_argument("finish() needs a concrete outcome");
    }

    // A skipped run or failed standalone test leaves an existing error report in place.
    const bool keepLast = (outcome == LastResult::Outcome::TestFailed || outcome == LastResult::Outcome::Skipped)
                          && e->prior == Status::Error;
    if (!keepLast) next.last_result = {outcome, std::move(reason), std::move(warnings), util::now()};
    next.pid.reset();

    // The worker is done either way; the slot is released even when the store rejects the write,
    // and the next persisted transition brings the record back in line.
    e->state = next;
    e->prior = next.status;
    e->token.reset();

    Registry::state()->info("[StateTracker] Transfer {} finished: {} -> {}", id, to_string(outcome), to_string(next.status));
    persist(id, next);
}

Snapshot Tracker::snapshot(const unsigned int id) {
    const auto e = entry(id);
    if (!e) throw std::invalid_argument("Unknown transfer definition: " + std::to_string(id));

    std::scoped_lock lock(e->mutex);
    return {id, e->state.status, e->state.pid, e->state.last_result};
}

std::vector<StatusEntry> Tracker::statusesOf(const Category category) {
    std::vector<StatusEntry> out;
    for (const auto& def : store_->definitions()) {
        if (def.category != category) continue;
        const auto e = entry(def);
        std::scoped_lock lock(e->mutex);
        out.push_back({def.id, def.name, e->state.status});
    }
    return out;
}

bool Tracker::forget(const unsigned int id) {
    std::unique_lock lock(entriesMutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) return true;

    const auto held = it->second;
    std::scoped_lock entryLock(held->mutex);
    const auto status = held->state.status;
    if (status != Status::Idle && status != Status::Error) return false;

    entries_.erase(it);
    Registry::state()->debug("[StateTracker] Transfer {} reloaded from the record store", id);
    return true;
}

unsigned int Tracker::resetInFlight() {
    unsigned int count = 0;
    for (const auto& def : store_->definitions()) {
        const auto e = entry(def);
        std::scoped_lock lock(e->mutex);
        const auto s = e->state.status;
        if (s == Status::Idle || s == Status::Error) continue;

        Registry::state()->warn("[StateTracker] Transfer {} ('{}') was left {}, resetting to idle", def.id, def.name, to_string(s));
        auto next = e->state;
        next.status = Status::Idle;
        next.pid.reset();
        persist(def.id, next);

        e->state = std::move(next);
        e->prior = Status::Idle;
        e->token.reset();
        ++count;
    }
    return count;
}

std::vector<unsigned int> Tracker::inFlight() const {
    std::vector<std::pair<unsigned int, std::shared_ptr<Entry>>> held;
    {
        std::shared_lock lock(entriesMutex_);
        held.assign(entries_.begin(), entries_.end());
    }

    std::vector<unsigned int> out;
    for (const auto& [id, e] : held) {
        std::scoped_lock lock(e->mutex);
        if (e->state.status != Status::Idle && e->state.status != Status::Error) out.push_back(id);
    }
    return out;
}

void Tracker::updateSizes(const SizeSnapshot& sizes) {
    {
        std::scoped_lock lock(sizesMutex_);
        sizes_ = sizes;
    }
    store_->saveSizes(sizes);
}

SizeSnapshot Tracker::sizes() const {
    std::scoped_lock lock(sizesMutex_);
    return sizes_;
}

std::string ovdm::state::to_string(const StartResult r) {
    switch (r) {
        case StartResult::Ok: return "ok";
        case StartResult::AlreadyRunning: return "already_running";
        case StartResult::NotFound: return "not_found";
        default: throw std::invalid_argument("Unknown start result");
    }
}

std::string ovdm::state::to_string(const StopResult r) {
    switch (r) {
        case StopResult::NotRunning: return "not_running";
        case StopResult::Dequeued: return "dequeued";
        case StopResult::Stopping: return "stopping";
        default: throw std::invalid_argument("Unknown stop result");
    }
}
