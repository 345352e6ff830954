#pragma once

#include "process/Handle.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace ovdm::cancel {

// Shared between the worker running a job and whoever wants it stopped.
// The worker attaches each external process it spawns; cancel() flags the job and terminates that process.
class Token {
public:
    void cancel();

    [[nodiscard]] bool cancelled() const { return cancelled_.load(); }

    void attach(std::shared_ptr<process::Handle> handle);
    void detach();

    [[nodiscard]] std::optional<int> pid() const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::shared_ptr<process::Handle> handle_;
};

}
