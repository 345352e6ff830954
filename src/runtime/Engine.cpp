#include "runtime/Engine.hpp"
#include "tasks/ExternalCommand.hpp"
#include "tasks/PostHook.hpp"
#include "tasks/RunTransfer.hpp"
#include "tasks/StopJob.hpp"
#include "tasks/TestTransfer.hpp"
#include "log/Registry.hpp"

using namespace ovdm::runtime;
using namespace ovdm::concurrency;
using namespace ovdm::types;
using namespace ovdm::log;

std::map<TaskKind, unsigned int> ovdm::runtime::poolSizes(const std::map<std::string, unsigned int>& workers) {
    std::map<TaskKind, unsigned int> out;
    for (const auto kind : kAllTaskKinds) out[kind] = defaultPoolSize(kind);
    for (const auto& [name, size] : workers) {
        if (size == 0) throw std::invalid_argument("Worker pool for " + name + " must have at least one worker");
        out[taskKindFromString(name)] = size;
    }
    return out;
}

Engine::Engine(config::Config config, std::shared_ptr<state::RecordStore> store,
               std::shared_ptr<process::Runner> runner, std::shared_ptr<protocols::AdapterFactory> adapters)
    : ctx_(std::make_shared<tasks::Context>()), queue_(std::make_shared<JobQueue>()) {
    if (!store) throw std::invalid_argument("Engine requires a record store");
    if (!runner) throw std::invalid_argument("Engine requires a process runner");

    ctx_->config = std::move(config);
    ctx_->store = std::move(store);
    ctx_->runner = std::move(runner);
    ctx_->tracker = std::make_shared<state::Tracker>(ctx_->store);
    ctx_->filter = std::make_shared<filter::Engine>(ctx_->config.warehouse, ctx_->config.filters);
    ctx_->adapters = adapters ? std::move(adapters) : std::make_shared<protocols::DefaultAdapterFactory>(ctx_->runner);
    ctx_->canceller = std::make_shared<cancel::Manager>(ctx_->tracker);

    registerTasks();

    dispatcher_ = std::make_shared<hooks::Dispatcher>(hooks::Table::fromConfig(ctx_->config.hooks), queue_);
    queue_->setCompletionListener([d = dispatcher_](const Job& job, const JobResult& result) {
        d->onCompleted(job, result);
    });

    enqueuer_ = std::make_shared<sched::Enqueuer>(ctx_, queue_);
}

Engine::~Engine() {
    shutdown();
}

void Engine::registerTasks() {
    const auto sizes = poolSizes(ctx_->config.workers);

    for (const auto kind : kAllTaskKinds) {
        JobQueue::Handler handler;
        switch (kind) {
            case TaskKind::RunCollectionSystemTransfer:
            case TaskKind::RunCruiseDataTransfer:
            case TaskKind::RunShipToShoreTransfer:
                handler = tasks::RunTransfer(ctx_);
                break;
            case TaskKind::TestCollectionSystemTransfer:
            case TaskKind::TestCruiseDataTransfer:
                handler = tasks::TestTransfer(ctx_);
                break;
            case TaskKind::StopJob:
                handler = tasks::StopJob(ctx_);
                break;
            case TaskKind::UpdateDataDashboard:
            case TaskKind::UpdateMD5Summary:
            case TaskKind::RebuildCruiseDirectory:
                handler = tasks::ExternalCommand(ctx_, kind);
                break;
            case TaskKind::PostCollectionSystemTransfer:
            case TaskKind::PostDataDashboard:
                handler = tasks::PostHook(ctx_, kind);
                break;
        }
        queue_->registerTask(kind, sizes.at(kind), std::move(handler));
    }
}

unsigned int Engine::start() {
    const auto reset = ctx_->tracker->resetInFlight();
    Registry::ovdm()->info("[Engine] Started; {} definition(s) recovered to idle", reset);
    return reset;
}

JobResult Engine::test(const unsigned int id) {
    const auto def = ctx_->store->definition(id);
    const auto kind = testTaskFor(def ? def->category : Category::CollectionSystem);
    return queue_->submitAndWait(kind, {{"id", id}}, id);
}

ovdm::sched::EnqueueResult Engine::run(const unsigned int id) {
    auto result = enqueuer_->enqueue(id);
    Registry::ovdm()->info("[Engine] Run {} -> {}{}", id, sched::to_string(result.status),
                           result.reason.empty() ? "" : ": " + result.reason);
    return result;
}

std::string Engine::stop(const unsigned int id) {
    return queue_->submit(TaskKind::StopJob, {{"id", id}}, id);
}

ovdm::state::Snapshot Engine::snapshot(const unsigned int id) {
    return ctx_->tracker->snapshot(id);
}

std::vector<ovdm::state::StatusEntry> Engine::statusesOf(const Category category) {
    return ctx_->tracker->statusesOf(category);
}

std::string Engine::definitionChanged(const unsigned int id) {
    const auto dropped = ctx_->tracker->forget(id);
    Registry::ovdm()->info("[Engine] Definition {} changed{}", id, dropped ? "; cached state dropped" : "");
    return queue_->submit(TaskKind::RebuildCruiseDirectory, {{"id", id}}, id);
}

void Engine::shutdown() {
    // Pools join their workers, so anything still copying has to be stopped first.
    for (const auto id : ctx_->tracker->inFlight()) {
        try {
            const auto result = ctx_->tracker->requestStop(id);
            Registry::ovdm()->info("[Engine] Shutdown: transfer {} {}", id, state::to_string(result));
        } catch (const std::exception& e) {
            Registry::ovdm()->error("[Engine] Shutdown: unable to stop transfer {}: {}", id, e.what());
        }
    }
    queue_->shutdown();
}
