#pragma once

#include "concurrency/Job.hpp"
#include "concurrency/ThreadPool.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <boost/uuid/random_generator.hpp>

namespace ovdm::concurrency {

// Named task kinds, each served by its own fixed-size pool.
class JobQueue {
public:
    using Handler = std::function<JobResult(const Job&)>;
    using CompletionListener = std::function<void(const Job&, const JobResult&)>;

    JobQueue() = default;
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    void registerTask(TaskKind kind, unsigned int poolSize, Handler handler);
    [[nodiscard]] bool registered(TaskKind kind) const;

    // Throws std::invalid_argument naming the first kind with no handler.
    void requireRegistered(const std::vector<TaskKind>& kinds) const;

    // Called on the worker thread after every successful job.
    void setCompletionListener(CompletionListener listener);

    // Background: returns the queue handle immediately.
    std::string submit(TaskKind kind, nlohmann::json payload = nlohmann::json::object(),
                       std::optional<unsigned int> definitionId = std::nullopt);

    // Synchronous: blocks until a worker has run the job and returns its result.
    JobResult submitAndWait(TaskKind kind, nlohmann::json payload = nlohmann::json::object(),
                            std::optional<unsigned int> definitionId = std::nullopt);

    [[nodiscard]] size_t queueDepth(TaskKind kind) const;
    [[nodiscard]] unsigned int busy(TaskKind kind) const;
    [[nodiscard]] unsigned int poolSize(TaskKind kind) const;

    void shutdown();

private:
    struct Lane {
        std::shared_ptr<ThreadPool> pool;
        Handler handler;
    };

    mutable std::shared_mutex lanesMutex_;
    std::map<TaskKind, std::shared_ptr<Lane>> lanes_;

    std::mutex listenerMutex_;
    std::shared_ptr<CompletionListener> listener_;

    std::mutex uuidMutex_;
    boost::uuids::random_generator uuidGen_;

    std::shared_ptr<Lane> lane(TaskKind kind) const;
    Job makeJob(TaskKind kind, nlohmann::json payload, std::optional<unsigned int> definitionId, Mode mode);
    std::shared_ptr<PromisedTask> makeTask(Job job, const std::shared_ptr<Lane>& lane);
};

}
