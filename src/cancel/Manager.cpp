#include "cancel/Manager.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ovdm::cancel;
using namespace ovdm::state;
using namespace ovdm::types;
using namespace ovdm::log;

Manager::Manager(std::shared_ptr<Tracker> tracker) : tracker_(std::move(tracker)) {
    if (!tracker_) throw std::invalid_argument("Cancellation manager requires a state tracker");
}

StopResult Manager::stop(const unsigned int id) const {
    const auto snap = tracker_->snapshot(id);

    if (!snap.pid && snap.status != Status::Queued) {
        Registry::cancel()->info("[CancellationManager] Transfer {} has no job in flight ({}), nothing to stop",
                                 id, to_string(snap.status));
        return StopResult::NotRunning;
    }

    const auto result = tracker_->requestStop(id);
    Registry::cancel()->info("[CancellationManager] Stop transfer {}: {}", id, to_string(result));
    return result;
}
