#include "concurrency/JobQueue.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

using namespace ovdm::concurrency;
using namespace ovdm::log;

namespace {

struct JobTask final : ovdm::concurrency::PromisedTask {
    Job job;
    JobQueue::Handler handler;
    std::shared_ptr<JobQueue::CompletionListener> listener;

    JobTask(Job j, JobQueue::Handler h, std::shared_ptr<JobQueue::CompletionListener> l)
        : job(std::move(j)), handler(std::move(h)), listener(std::move(l)) {}

    void operator()() override {
        Registry::queue()->debug("[JobQueue] {} claimed ({})", job.handle, to_string(job.mode));

        JobResult result;
        try {
            result = handler(job);
        } catch (const std::exception& e) {
            Registry::queue()->error("[JobQueue] {} failed: {}", job.handle, e.what());
            result = JobResult::failed(e.what());
        }

        Registry::queue()->debug("[JobQueue] {} finished (success={})", job.handle, result.success);
        promise.set_value(result);

        if (!result.success || !listener || !*listener) return;
        try {
            (*listener)(job, result);
        } catch (const std::exception& e) {
            Registry::queue()->error("[JobQueue] Completion listener failed for {}: {}", job.handle, e.what());
        }
    }
};

}

std::string ovdm::concurrency::to_string(const Mode mode) {
    return mode == Mode::Background ? "background" : "synchronous";
}

JobQueue::~JobQueue() {
    shutdown();
}

void JobQueue::registerTask(const TaskKind kind, const unsigned int poolSize, Handler handler) {
    if (!handler) throw std::invalid_argument("No handler given for " + to_string(kind));

    auto lane = std::make_shared<Lane>();
    lane->pool = std::make_shared<ThreadPool>(to_string(kind), poolSize);
    lane->handler = std::move(handler);

    std::unique_lock lock(lanesMutex_);
    if (lanes_.contains(kind)) throw std::invalid_argument("Task already registered: " + to_string(kind));
    lanes_.emplace(kind, std::move(lane));

    Registry::queue()->debug("[JobQueue] Registered {} with {} worker(s)", to_string(kind), poolSize);
}

bool JobQueue::registered(const TaskKind kind) const {
    std::shared_lock lock(lanesMutex_);
    return lanes_.contains(kind);
}

void JobQueue::requireRegistered(const std::vector<TaskKind>& kinds) const {
    for (const auto kind : kinds)
        if (!registered(kind)) throw std::invalid_argument("No worker registered for task " + to_string(kind));
}

void JobQueue::setCompletionListener(CompletionListener listener) {
    std::scoped_lock lock(listenerMutex_);
    listener_ = std::make_shared<CompletionListener>(std::move(listener));
}

std::shared_ptr<JobQueue::Lane> JobQueue::lane(const TaskKind kind) const {
    std::shared_lock lock(lanesMutex_);
    const auto it = lanes_.find(kind);
    if (it == lanes_.end()) throw std::invalid_argument("No worker registered for task " + to_string(kind));
    return it->second;
}

Job JobQueue::makeJob(const TaskKind kind, nlohmann::json payload, const std::optional<unsigned int> definitionId, const Mode mode) {
    std::string uuid;
    {
        std::scoped_lock lock(uuidMutex_);
        uuid = boost::uuids::to_string(uuidGen_());
    }

    Job job;
    job.kind = kind;
    job.definition_id = definitionId;
    job.mode = mode;
    job.handle = to_string(kind) + ":" + uuid;
    job.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
    return job;
}

std::shared_ptr<PromisedTask> JobQueue::makeTask(Job job, const std::shared_ptr<Lane>& lane) {
    std::shared_ptr<CompletionListener> listener;
    {
        std::scoped_lock lock(listenerMutex_);
        listener = listener_;
    }
    return std::make_shared<JobTask>(std::move(job), lane->handler, std::move(listener));
}

std::string JobQueue::submit(const TaskKind kind, nlohmann::json payload, const std::optional<unsigned int> definitionId) {
    const auto l = lane(kind);
    auto job = makeJob(kind, std::move(payload), definitionId, Mode::Background);
    auto handle = job.handle;

    l->pool->submit(makeTask(std::move(job), l));
    Registry::queue()->info("[JobQueue] Enqueued {} (queue depth {})", handle, l->pool->queueDepth());
    return handle;
}

JobResult JobQueue::submitAndWait(const TaskKind kind, nlohmann::json payload, const std::optional<unsigned int> definitionId) {
    const auto l = lane(kind);
    auto job = makeJob(kind, std::move(payload), definitionId, Mode::Synchronous);
    const auto handle = job.handle;

    const auto task = makeTask(std::move(job), l);
    auto future = task->getFuture();
    if (!future) throw std::logic_error("Synchronous task has no future");

    l->pool->submit(task);
    Registry::queue()->info("[JobQueue] Enqueued {} and waiting", handle);
    return future->get();
}

size_t JobQueue::queueDepth(const TaskKind kind) const { return lane(kind)->pool->queueDepth(); }

unsigned int JobQueue::busy(const TaskKind kind) const { return lane(kind)->pool->busyCount(); }

unsigned int JobQueue::poolSize(const TaskKind kind) const { return lane(kind)->pool->workerCount(); }

void JobQueue::shutdown() {
    std::map<TaskKind, std::shared_ptr<Lane>> lanes;
    {
        std::shared_lock lock(lanesMutex_);
        lanes = lanes_;
    }
    for (const auto& [kind, lane] : lanes) lane->pool->stop();
}
