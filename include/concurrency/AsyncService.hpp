#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ovdm::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Called by stop() before joining, to unblock a loop parked in a syscall.
    virtual void onStop() {}

    // Sleeps up to d; returns false as soon as the service is asked to stop.
    bool waitFor(std::chrono::milliseconds d);

private:
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};

}
