#pragma once

#include "state/Tracker.hpp"

#include <memory>

namespace ovdm::cancel {

// Stops in-flight work by definition id. Only the tracker knows which process belongs to a job.
class Manager {
public:
    explicit Manager(std::shared_ptr<state::Tracker> tracker);

    // A definition with no job attached is left untouched: no status change, no signal.
    state::StopResult stop(unsigned int id) const;

private:
    std::shared_ptr<state::Tracker> tracker_;
};

}
