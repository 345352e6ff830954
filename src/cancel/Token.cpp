#include "cancel/Token.hpp"
#include "log/Registry.hpp"

using namespace ovdm::cancel;
using namespace ovdm::log;

void Token::cancel() {
    cancelled_.store(true);

    std::shared_ptr<process::Handle> handle;
    {
        std::scoped_lock lock(mutex_);
        handle = handle_;
    }

    if (handle && !handle->terminate())
        Registry::cancel()->debug("[CancellationToken] Process {} had already exited", handle->pid());
}

void Token::attach(std::shared_ptr<process::Handle> handle) {
    {
        std::scoped_lock lock(mutex_);
        handle_ = handle;
    }

    // A stop that landed between spawn and attach must still reach the process.
    if (cancelled_.load() && handle) handle->terminate();
}

void Token::detach() {
    std::scoped_lock lock(mutex_);
    handle_.reset();
}

std::optional<int> Token::pid() const {
    std::scoped_lock lock(mutex_);
    if (!handle_) return std::nullopt;
    return handle_->pid();
}
