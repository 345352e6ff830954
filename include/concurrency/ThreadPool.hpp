#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ovdm::concurrency {

// Fixed-size FIFO pool: never more than nThreads tasks run at once, the rest wait in arrival order.
class ThreadPool {
public:
    ThreadPool(std::string name, unsigned int nThreads);

    ~ThreadPool();

    void stop();

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int busyCount() const { return busy_.load(); }
    [[nodiscard]] unsigned int workerCount() const;
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;
    std::atomic<unsigned int> busy_{0};

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace ovdm::concurrency
