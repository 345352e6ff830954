#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ovdm::concurrency { class AsyncService; }
namespace ovdm::ctl { class Router; class Server; }
namespace ovdm::sched { class Scheduler; class SizeCacher; }

namespace ovdm::runtime {

class Engine;

// Owns the long-running services around the engine and restarts any that die.
class Manager {
public:
    explicit Manager(std::shared_ptr<Engine> engine);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void startAll();
    void stopAll();
    void restartService(const std::string& name);

    [[nodiscard]] bool allRunning() const;

    [[nodiscard]] std::shared_ptr<sched::Scheduler> scheduler() const { return scheduler_; }

private:
    std::shared_ptr<Engine> engine_;
    std::shared_ptr<sched::Scheduler> scheduler_;
    std::shared_ptr<sched::SizeCacher> sizeCacher_;
    std::shared_ptr<ctl::Server> ctlServer_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;

    // Watchdog state
    std::thread watchdogThread_;
    std::atomic<bool> watchdogRunning_{false};

    void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);

    void startWatchdog();
    void stopWatchdog();
};

}
