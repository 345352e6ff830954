#include "support/EngineFixture.hpp"

#include "sched/Scheduler.hpp"
#include "sched/SizeCacher.hpp"
#include "util/files.hpp"

using namespace ovdm;
using namespace ovdm::types;
using ovdm::test::waitUntil;

namespace {

class SchedulerTest : public ovdm::test::EngineFixture {
protected:
    std::unique_ptr<sched::Scheduler> scheduler;

    void start(config::Config cfg) {
        boot(std::move(cfg));
        scheduler = std::make_unique<sched::Scheduler>(engine->context(), engine->enqueuer());
    }

    void TearDown() override {
        if (scheduler) scheduler->stop();
        EngineFixture::TearDown();
    }

    [[nodiscard]] VoyageContext voyage() const { return store->voyageContext(); }
};

}

TEST_F(SchedulerTest, NothingIsQueuedWhileTheSystemIsOff) {
    auto v = voyage();
    v.system_on = false;
    store->setVoyage(v);
    start(baseConfig());

    EXPECT_TRUE(scheduler->runCycle().empty());
    EXPECT_EQ(status(), Status::Idle);
}

TEST_F(SchedulerTest, CycleQueuesIdleDefinitions) {
    start(baseConfig());

    const auto cycle = scheduler->runCycle();
    ASSERT_EQ(cycle.size(), 1u);
    EXPECT_EQ(cycle[0].id, kScsId);
    EXPECT_TRUE(cycle[0].result.queued());

    ASSERT_TRUE(waitUntil([&] { return script->copies.load() == 1 && status() == Status::Idle; }));
}

TEST_F(SchedulerTest, BusyDefinitionsAreSkipped) {
    script->blockingHandle = std::make_shared<ovdm::test::FakeHandle>(900);
    start(baseConfig());

    ASSERT_EQ(scheduler->runCycle().size(), 1u);
    ASSERT_TRUE(waitUntil([&] { return status() == Status::Running; }));

    EXPECT_TRUE(scheduler->runCycle().empty());

    script->blockingHandle->terminate();
    ASSERT_TRUE(waitUntil([&] { return status() != Status::Running; }));
}

TEST_F(SchedulerTest, DisabledDefinitionsAreIneligible) {
    auto def = scs();
    def.enable = false;
    store->put(def);
    start(baseConfig());

    EXPECT_FALSE(scheduler->eligible(def, voyage()));
    EXPECT_TRUE(scheduler->runCycle().empty());
}

TEST_F(SchedulerTest, LoweringDefinitionsWaitForALowering) {
    auto def = scs();
    def.cruise_or_lowering = Scope::Lowering;
    store->put(def);
    start(baseConfig());

    EXPECT_FALSE(scheduler->eligible(def, voyage()));

    auto v = voyage();
    v.lowering_id = "J2-1401";
    EXPECT_TRUE(scheduler->eligible(def, v));
}

TEST_F(SchedulerTest, OutboundDefinitionsFollowConfiguration) {
    auto backup = scs();
    backup.id = 2;
    backup.name = "Backup";
    backup.category = Category::CruiseData;
    backup.dest_dir = "/mnt/backup";
    store->put(backup);

    auto cfg = baseConfig();
    cfg.scheduler.include_outbound = false;
    start(std::move(cfg));

    EXPECT_FALSE(scheduler->eligible(backup, voyage()));
    EXPECT_TRUE(scheduler->eligible(scs(), voyage()));
}

TEST_F(SchedulerTest, ErroredDefinitionsRetryOnlyWhenConfigured) {
    auto def = scs();
    def.live.status = Status::Error;
    store->put(def);

    auto cfg = baseConfig();
    cfg.scheduler.retry_errored = false;
    start(std::move(cfg));
    EXPECT_FALSE(scheduler->eligible(def, voyage()));
}

TEST_F(SchedulerTest, ErroredDefinitionsRetryByDefault) {
    auto def = scs();
    def.live.status = Status::Error;
    store->put(def);
    start(baseConfig());

    EXPECT_TRUE(scheduler->eligible(def, voyage()));
}

TEST_F(SchedulerTest, ServiceRunsAFirstCycleAfterTheStartupDelay) {
    auto cfg = baseConfig();
    cfg.scheduler.startup_delay_seconds = 0;
    start(std::move(cfg));

    scheduler->start();
    EXPECT_TRUE(scheduler->isRunning());
    ASSERT_TRUE(waitUntil([&] { return script->copies.load() == 1; }));

    scheduler->stop();
    EXPECT_FALSE(scheduler->isRunning());
}

TEST_F(SchedulerTest, SizeCacherMeasuresTheCruiseDirectory) {
    start(baseConfig());
    util::writeFile(tmp.path() / "FK001" / "SCS" / "nav.log", "0123456789");

    sched::SizeCacher cacher(engine->context());
    const auto sizes = cacher.refresh();

    ASSERT_TRUE(sizes.cruise_bytes.has_value());
    EXPECT_EQ(*sizes.cruise_bytes, 10u);
    EXPECT_FALSE(sizes.lowering_bytes.has_value());
    EXPECT_EQ(store->sizes().cruise_bytes, 10u);
}
