#include <gtest/gtest.h>

#include "cancel/Manager.hpp"
#include "state/Tracker.hpp"
#include "support/FakeProcess.hpp"
#include "support/MemoryStore.hpp"

#include <atomic>
#include <thread>

using namespace ovdm;
using namespace ovdm::state;
using namespace ovdm::types;
using ovdm::test::FakeHandle;
using ovdm::test::MemoryStore;

namespace {

TransferDefinition definition(const unsigned int id, const Status status = Status::Idle) {
    TransferDefinition def;
    def.id = id;
    def.name = "CS" + std::to_string(id);
    def.enable = true;
    def.live.status = status;
    return def;
}

class TrackerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    std::shared_ptr<Tracker> tracker = std::make_shared<Tracker>(store);
    cancel::Manager canceller{tracker};

    void SetUp() override {
        store->put(definition(1));
        store->put(definition(2, Status::Error));
    }
};

}

TEST_F(TrackerTest, OnlyOneConcurrentStartWins) {
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] { if (tracker->tryStart(1) == StartResult::Ok) ++wins; });
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Queued);
    EXPECT_EQ(store->live(1).status, Status::Queued);
}

TEST_F(TrackerTest, UnknownDefinition) {
    EXPECT_EQ(tracker->tryStart(99), StartResult::NotFound);
    EXPECT_THROW((void)tracker->snapshot(99), std::invalid_argument);
    EXPECT_THROW((void)tracker->requestStop(99), std::invalid_argument);
}

TEST_F(TrackerTest, ErroredDefinitionsMayStartAgain) {
    EXPECT_EQ(tracker->tryStart(2), StartResult::Ok);
}

TEST_F(TrackerTest, FullLifecycleEndsIdleWithResult) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    const auto token = tracker->claim(1, 100);
    ASSERT_NE(token, nullptr);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Starting);

    ASSERT_TRUE(tracker->markRunning(1, 100));
    tracker->attachProcess(1, std::make_shared<FakeHandle>(555));
    EXPECT_EQ(tracker->snapshot(1).pid, 555);
    EXPECT_EQ(tracker->tryStart(1), StartResult::AlreadyRunning);

    tracker->finish(1, LastResult::Outcome::Success);
    const auto snap = tracker->snapshot(1);
    EXPECT_EQ(snap.status, Status::Idle);
    EXPECT_FALSE(snap.pid.has_value());
    EXPECT_EQ(snap.last_result.outcome, LastResult::Outcome::Success);
    EXPECT_EQ(store->live(1).status, Status::Idle);
}

TEST_F(TrackerTest, FailureLeavesErrorWithReason) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    ASSERT_NE(tracker->claim(1, 100), nullptr);
    tracker->finish(1, LastResult::Outcome::Failure, "Source directory unreachable");

    const auto snap = tracker->snapshot(1);
    EXPECT_EQ(snap.status, Status::Error);
    EXPECT_EQ(snap.last_result.reason, "Source directory unreachable");
}

TEST_F(TrackerTest, FailedStandaloneTestRestoresPriorState) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    ASSERT_NE(tracker->claim(1, 100), nullptr);
    tracker->finish(1, LastResult::Outcome::TestFailed, "SMB server");
    EXPECT_EQ(tracker->snapshot(1).status, Status::Idle);
    EXPECT_EQ(tracker->snapshot(1).last_result.outcome, LastResult::Outcome::TestFailed);
}

TEST_F(TrackerTest, SkippedRunKeepsEarlierErrorReport) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    ASSERT_NE(tracker->claim(1, 100), nullptr);
    tracker->finish(1, LastResult::Outcome::Failure, "disk full");

    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    ASSERT_NE(tracker->claim(1, 100), nullptr);
    tracker->finish(1, LastResult::Outcome::Skipped, "nothing to do");

    const auto snap = tracker->snapshot(1);
    EXPECT_EQ(snap.status, Status::Error);
    EXPECT_EQ(snap.last_result.outcome, LastResult::Outcome::Failure);
    EXPECT_EQ(snap.last_result.reason, "disk full");
}

TEST_F(TrackerTest, StopOnIdleIsANoOp) {
    const auto savesBefore = store->saves();

    EXPECT_EQ(canceller.stop(1), StopResult::NotRunning);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Idle);
    EXPECT_FALSE(tracker->snapshot(1).pid.has_value());
    EXPECT_EQ(store->saves(), savesBefore);
}

TEST_F(TrackerTest, StopBeforeClaimDequeuesTheJob) {
    ASSERT_EQ(tracker->tryStart(2), StartResult::Ok);

    EXPECT_EQ(canceller.stop(2), StopResult::Dequeued);
    EXPECT_EQ(tracker->snapshot(2).status, Status::Error);
    EXPECT_EQ(tracker->claim(2, 100), nullptr);
}

TEST_F(TrackerTest, StopWhileRunningTerminatesTheProcess) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    const auto token = tracker->claim(1, 100);
    ASSERT_TRUE(tracker->markRunning(1, 100));
    const auto handle = std::make_shared<FakeHandle>(555);
    tracker->attachProcess(1, handle);

    EXPECT_EQ(canceller.stop(1), StopResult::Stopping);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Stopping);
    EXPECT_EQ(handle->terminations(), 1u);
    EXPECT_TRUE(token->cancelled());

    tracker->finish(1, LastResult::Outcome::Cancelled);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Idle);
}

TEST_F(TrackerTest, ProcessAttachedAfterStopIsTerminatedImmediately) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    const auto token = tracker->claim(1, 100);
    ASSERT_EQ(tracker->requestStop(1), StopResult::Stopping);
    EXPECT_TRUE(token->cancelled());
    EXPECT_FALSE(tracker->markRunning(1, 100));

    const auto handle = std::make_shared<FakeHandle>(777);
    tracker->attachProcess(1, handle);
    EXPECT_EQ(handle->terminations(), 1u);
}

TEST_F(TrackerTest, ResetInFlightRecoversStaleStates) {
    auto stale = definition(3, Status::Running);
    stale.live.pid = 4321;
    store->put(stale);

    EXPECT_EQ(tracker->resetInFlight(), 1u);
    EXPECT_EQ(tracker->snapshot(3).status, Status::Idle);
    EXPECT_FALSE(store->live(3).pid.has_value());
    EXPECT_EQ(tracker->snapshot(2).status, Status::Error);
}

TEST_F(TrackerTest, StatusesAreFilteredByCategory) {
    auto outbound = definition(4);
    outbound.category = Category::ShipToShore;
    store->put(outbound);

    const auto cs = tracker->statusesOf(Category::CollectionSystem);
    ASSERT_EQ(cs.size(), 2u);
    EXPECT_EQ(cs[0].name, "CS1");
    EXPECT_EQ(cs[1].status, Status::Error);

    EXPECT_EQ(tracker->statusesOf(Category::ShipToShore).size(), 1u);
    EXPECT_TRUE(tracker->statusesOf(Category::CruiseData).empty());
}

TEST_F(TrackerTest, ForgetRefusesBusyDefinitionsAndReloadsIdleOnes) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    EXPECT_FALSE(tracker->forget(1));

    ASSERT_NE(tracker->claim(1, 100), nullptr);
    tracker->finish(1, LastResult::Outcome::Success);
    EXPECT_TRUE(tracker->forget(1));

    auto edited = definition(1, Status::Error);
    store->put(edited);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Error);
}

TEST_F(TrackerTest, SizesArePersisted) {
    SizeSnapshot sizes;
    sizes.cruise_bytes = 1024;
    sizes.updated_at = 1700000000;
    tracker->updateSizes(sizes);

    EXPECT_EQ(tracker->sizes().cruise_bytes, 1024u);
    EXPECT_EQ(store->sizes().cruise_bytes, 1024u);
}

TEST_F(TrackerTest, RejectedWriteLeavesTheDefinitionStartable) {
    store->failSaves(true);
    EXPECT_THROW((void)tracker->tryStart(1), std::runtime_error);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Idle);
    EXPECT_EQ(store->live(1).status, Status::Idle);

    store->failSaves(false);
    EXPECT_EQ(tracker->tryStart(1), StartResult::Ok);
    EXPECT_EQ(store->live(1).status, Status::Queued);
}

TEST_F(TrackerTest, RejectedClaimKeepsTheJobQueued) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);

    store->failSaves(true);
    EXPECT_THROW((void)tracker->claim(1, 100), std::runtime_error);
    const auto snap = tracker->snapshot(1);
    EXPECT_EQ(snap.status, Status::Queued);
    EXPECT_FALSE(snap.pid.has_value());

    store->failSaves(false);
    EXPECT_EQ(tracker->requestStop(1), StopResult::Dequeued);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Idle);
}

TEST_F(TrackerTest, RejectedStopChangesNothing) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    ASSERT_NE(tracker->claim(1, 100), nullptr);

    store->failSaves(true);
    EXPECT_THROW((void)tracker->requestStop(1), std::runtime_error);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Starting);
    store->failSaves(false);
}

TEST_F(TrackerTest, FinishReleasesTheDefinitionEvenWhenTheWriteFails) {
    ASSERT_EQ(tracker->tryStart(1), StartResult::Ok);
    ASSERT_NE(tracker->claim(1, 100), nullptr);

    store->failSaves(true);
    EXPECT_THROW(tracker->finish(1, LastResult::Outcome::Failure, "copy failed"), std::runtime_error);
    EXPECT_EQ(tracker->snapshot(1).status, Status::Error);
    EXPECT_FALSE(tracker->snapshot(1).pid.has_value());

    // The stale Starting row is overwritten by the next successful transition.
    store->failSaves(false);
    EXPECT_EQ(store->live(1).status, Status::Starting);
    EXPECT_EQ(tracker->tryStart(1), StartResult::Ok);
    EXPECT_EQ(store->live(1).status, Status::Queued);
}
