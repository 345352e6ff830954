#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ovdm::concurrency;
using namespace ovdm::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable()) {
        interruptFlag_.store(true);
        waitCv_.notify_all();
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::ovdm()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::ovdm()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::ovdm()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(waitMutex_);
        interruptFlag_.store(true);
    }
    waitCv_.notify_all();
    onStop();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    Registry::ovdm()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    Registry::ovdm()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

bool AsyncService::waitFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(waitMutex_);
    return !waitCv_.wait_for(lock, d, [this] { return interruptFlag_.load(); });
}
