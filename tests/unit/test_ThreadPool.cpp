#include <gtest/gtest.h>

#include "concurrency/ThreadPool.hpp"
#include "support/FakeProcess.hpp"

#include <chrono>
#include <future>

using namespace ovdm::concurrency;
using ovdm::test::waitUntil;

namespace {

struct CountingTask : Task {
    std::atomic<unsigned int>& runs;
    explicit CountingTask(std::atomic<unsigned int>& r) : runs(r) {}
    void operator()() override { runs.fetch_add(1); }
};

}

TEST(ThreadPool, StopWakesEveryIdleWorker) {
    // Workers that have just gone to sleep must still see the stop.
    auto stopping = std::async(std::launch::async, [] {
        for (int i = 0; i < 200; ++i) {
            ThreadPool pool("stop", 4);
            pool.stop();
            EXPECT_EQ(pool.workerCount(), 0u);
        }
    });
    ASSERT_EQ(stopping.wait_for(std::chrono::seconds(20)), std::future_status::ready);
    stopping.get();
}

TEST(ThreadPool, SubmitAfterStopIsRejected) {
    std::atomic<unsigned int> runs{0};
    ThreadPool pool("rejects", 2);

    pool.submit(std::make_shared<CountingTask>(runs));
    ASSERT_TRUE(waitUntil([&] { return runs.load() == 1; }));

    pool.stop();
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(runs)), std::runtime_error);
    EXPECT_EQ(runs.load(), 1u);
    EXPECT_EQ(pool.queueDepth(), 0u);
}

TEST(ThreadPool, ZeroWorkersIsRejected) {
    EXPECT_THROW(ThreadPool("empty", 0), std::invalid_argument);
}
