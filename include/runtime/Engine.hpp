#pragma once

#include "concurrency/JobQueue.hpp"
#include "hooks/Dispatcher.hpp"
#include "sched/Enqueuer.hpp"
#include "tasks/Context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ovdm::runtime {

// Composition root for the transfer core: tracker, filter, adapters, worker pools and hook fan-out.
// Owns the admin boundary the control socket and the scheduler talk to.
class Engine {
public:
    Engine(config::Config config, std::shared_ptr<state::RecordStore> store,
           std::shared_ptr<process::Runner> runner,
           std::shared_ptr<protocols::AdapterFactory> adapters = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Boot recovery. Returns how many definitions were reset to Idle.
    unsigned int start();

    // Blocks until the connection test has run on a test worker.
    concurrency::JobResult test(unsigned int id);

    sched::EnqueueResult run(unsigned int id);

    // Background stopJob; returns the queue handle.
    std::string stop(unsigned int id);

    [[nodiscard]] state::Snapshot snapshot(unsigned int id);
    [[nodiscard]] std::vector<state::StatusEntry> statusesOf(types::Category category);

    // Drops cached state for the definition and asks for the cruise directory to be rebuilt.
    std::string definitionChanged(unsigned int id);

    void shutdown();

    [[nodiscard]] const std::shared_ptr<tasks::Context>& context() const { return ctx_; }
    [[nodiscard]] const std::shared_ptr<concurrency::JobQueue>& queue() const { return queue_; }
    [[nodiscard]] const std::shared_ptr<sched::Enqueuer>& enqueuer() const { return enqueuer_; }
    [[nodiscard]] const std::shared_ptr<hooks::Dispatcher>& dispatcher() const { return dispatcher_; }

private:
    std::shared_ptr<tasks::Context> ctx_;
    std::shared_ptr<concurrency::JobQueue> queue_;
    std::shared_ptr<sched::Enqueuer> enqueuer_;
    std::shared_ptr<hooks::Dispatcher> dispatcher_;

    void registerTasks();
};

// Pool size per task kind; throws std::invalid_argument for names that are not task kinds.
std::map<concurrency::TaskKind, unsigned int> poolSizes(const std::map<std::string, unsigned int>& workers);

}
