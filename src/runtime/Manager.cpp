#include "runtime/Manager.hpp"
#include "runtime/Engine.hpp"
#include "concurrency/AsyncService.hpp"
#include "ctl/Router.hpp"
#include "ctl/Server.hpp"
#include "sched/Scheduler.hpp"
#include "sched/SizeCacher.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <vector>

using namespace ovdm::runtime;
using namespace ovdm::log;

Manager::Manager(std::shared_ptr<Engine> engine) : engine_(std::move(engine)) {
    if (!engine_) throw std::invalid_argument("Manager requires an engine");

    const auto& ctx = engine_->context();

    scheduler_ = std::make_shared<sched::Scheduler>(ctx, engine_->enqueuer());
    services_["Scheduler"] = scheduler_;

    if (ctx->config.size_cacher.enabled) {
        sizeCacher_ = std::make_shared<sched::SizeCacher>(ctx);
        services_["SizeCacher"] = sizeCacher_;
    }

    if (ctx->config.ctl.enabled) {
        ctlServer_ = std::make_shared<ctl::Server>(ctx->config.ctl, std::make_shared<ctl::Router>(engine_));
        services_["CtlServer"] = ctlServer_;
    }
}

Manager::~Manager() {
    stopAll();
}

void Manager::startAll() {
    Registry::ovdm()->debug("[ServiceManager] Starting all services...");
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) tryStart(name, svc);
    }
    Registry::ovdm()->debug("[ServiceManager] All services started.");

    startWatchdog();
}

void Manager::stopAll() {
    stopWatchdog();

    Registry::ovdm()->debug("[ServiceManager] Stopping all services...");
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) stopService(name, svc);
    }
    Registry::ovdm()->debug("[ServiceManager] All services stopped.");
}

void Manager::restartService(const std::string& name) {
    std::scoped_lock lock(mutex_);

    const auto it = services_.find(name);
    if (it == services_.end()) throw std::invalid_argument("Unknown service: " + name);

    Registry::ovdm()->warn("[ServiceManager] Restarting service: {}", name);
    stopService(name, it->second);
    tryStart(name, it->second);
}

bool Manager::allRunning() const {
    std::scoped_lock lock(mutex_);
    for (const auto& [name, svc] : services_)
        if (!svc->isRunning()) return false;
    return true;
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    Registry::ovdm()->debug("[ServiceManager] Starting service: {}", name);
    try {
        svc->start();
    } catch (const std::exception& e) {
        Registry::ovdm()->error("[ServiceManager] Failed to start {}: {}", name, e.what());
    }
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc || !svc->isRunning()) return;

    Registry::ovdm()->debug("[ServiceManager] Stopping service: {}", name);
    try {
        svc->stop();
    } catch (const std::exception& e) {
        Registry::ovdm()->error("[ServiceManager] Failed to stop {} gracefully: {}", name, e.what());
    }
}

void Manager::startWatchdog() {
    if (watchdogRunning_.exchange(true)) return; // already running
    watchdogThread_ = std::thread([this]() {
        Registry::ovdm()->info("[ServiceManager] Watchdog started.");
        while (watchdogRunning_) {
            std::vector<std::string> down;
            {
                std::scoped_lock lock(mutex_);
                for (const auto& [name, svc] : services_)
                    if (svc && !svc->isRunning()) down.push_back(name);
            }
            for (const auto& name : down) {
                Registry::ovdm()->warn("[Watchdog] {} is down, restarting...", name);
                restartService(name);
            }
            for (int i = 0; i < 20 && watchdogRunning_; ++i)
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        Registry::ovdm()->info("[ServiceManager] Watchdog stopped.");
    });
}

void Manager::stopWatchdog() {
    if (!watchdogRunning_.exchange(false)) return;
    if (watchdogThread_.joinable())
        watchdogThread_.join();
}
