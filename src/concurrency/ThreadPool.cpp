#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

using namespace ovdm::concurrency;
using namespace ovdm::log;

ThreadPool::ThreadPool(std::string name, const unsigned int nThreads)
    : name_(std::move(name)), stopFlag(false) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool '" + name_ + "' needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load() && threads_.empty()) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
        stopFlag.store(true);
    }

    cv.notify_all();

    // Workers finish the job in hand; callers cancel long transfers before stopping a pool.
    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) t.detach();
        else t.join();
    }

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool '" + name_ + "' is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
                busy_.fetch_add(1);
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                Registry::queue()->error("[ThreadPool:{}] Task threw: {}", name_, e.what());
            }
            busy_.fetch_sub(1);
        }
    });
}
