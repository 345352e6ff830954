#include "support/EngineFixture.hpp"

#include "hooks/Table.hpp"

#include "util/files.hpp"

#include <algorithm>
#include <thread>

using namespace ovdm;
using namespace ovdm::types;
using namespace ovdm::concurrency;
using ovdm::test::waitUntil;

namespace fs = std::filesystem;

namespace {

class EngineTest : public ovdm::test::EngineFixture {};

}

TEST_F(EngineTest, SuccessfulRunFansOutHooksExactlyOnce) {
    auto cfg = baseConfig();
    cfg.hooks = {
        {"runCollectionSystemTransfer", {"updateDataDashboard"}},
        {"updateDataDashboard", {"updateMD5Summary"}}
    };
    cfg.task_commands = {{"updateDataDashboard", {"dashboard"}}, {"updateMD5Summary", {"md5"}}};
    boot(std::move(cfg));

    const auto result = engine->run(kScsId);
    ASSERT_TRUE(result.queued()) << result.reason;

    ASSERT_TRUE(waitUntil([&] { return runner->count("md5") == 1; }));
    ASSERT_TRUE(waitUntil([&] { return status() == Status::Idle; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(runner->count("dashboard"), 1u);
    EXPECT_EQ(runner->count("md5"), 1u);
    EXPECT_EQ(script->copies.load(), 1u);
    EXPECT_EQ(engine->snapshot(kScsId).last_result.outcome, LastResult::Outcome::Success);
}

TEST_F(EngineTest, HookCommandsReceiveTheTransferBlob) {
    auto cfg = baseConfig();
    cfg.hooks = {{"runCollectionSystemTransfer", {"updateDataDashboard"}}};
    cfg.task_commands = {{"updateDataDashboard", {"dashboard", "--quiet"}}};
    boot(std::move(cfg));

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return runner->count("dashboard") == 1; }));

    const auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls[0].argv.size(), 3u);
    EXPECT_EQ(calls[0].argv[1], "--quiet");

    const auto blob = nlohmann::json::parse(calls[0].argv[2]);
    EXPECT_EQ(blob.at("task"), "updateDataDashboard");
    EXPECT_EQ(blob.at("payload").at("cruiseID"), "FK001");
    EXPECT_EQ(blob.at("payload").at("collectionSystemTransferName"), "SCS");
    EXPECT_EQ(blob.at("payload").at("files").at("new"), nlohmann::json::array({"SCS/a.raw"}));
}

TEST_F(EngineTest, PartialCopyIsASuccessWithWarningsAndStillFansOut) {
    auto cfg = baseConfig();
    cfg.hooks = {{"runCollectionSystemTransfer", {"updateDataDashboard"}}};
    cfg.task_commands = {{"updateDataDashboard", {"dashboard"}}};
    script->candidates.push_back({"b.raw", 20, util::now() - 3600, false});
    script->copy.status = CopyResult::Status::Partial;
    script->copy.failures = {{"b.raw", "Permission denied (13)"}};
    boot(std::move(cfg));

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return runner->count("dashboard") == 1; }));
    ASSERT_TRUE(waitUntil([&] { return status() == Status::Idle; }));

    const auto last = engine->snapshot(kScsId).last_result;
    EXPECT_EQ(last.outcome, LastResult::Outcome::SuccessWithWarnings);
    EXPECT_EQ(last.warnings, std::vector<std::string>{"b.raw: Permission denied (13)"});
    EXPECT_EQ(last.reason, "1 warning(s)");
    EXPECT_FALSE(engine->snapshot(kScsId).pid.has_value());
}

TEST_F(EngineTest, SyncFromSourceRemovesFilesGoneFromTheSource) {
    auto def = scs();
    def.sync_from_source = true;
    def.staleness = 600;
    store->put(def);

    const auto dest = tmp.path() / "FK001" / "SCS";
    util::writeFile(dest / "a.raw", "previous");
    util::writeFile(dest / "fresh.raw", "previous");
    util::writeFile(dest / "stale.raw", "gone at the source");
    util::writeFile(dest / "old" / "gone.raw", "gone at the source");

    script->candidates.push_back({"fresh.raw", 5, util::now(), false});

    auto cfg = baseConfig();
    cfg.hooks = {{"runCollectionSystemTransfer", {"updateDataDashboard"}}};
    cfg.task_commands = {{"updateDataDashboard", {"dashboard"}}};
    boot(std::move(cfg));

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return runner->count("dashboard") == 1; }));

    EXPECT_TRUE(fs::exists(dest / "a.raw"));
    EXPECT_TRUE(fs::exists(dest / "fresh.raw"));
    EXPECT_FALSE(fs::exists(dest / "stale.raw"));
    EXPECT_FALSE(fs::exists(dest / "old"));

    const auto blob = nlohmann::json::parse(runner->calls().front().argv.back());
    auto deleted = blob.at("payload").at("files").at("deleted").get<std::vector<std::string>>();
    std::ranges::sort(deleted);
    EXPECT_EQ(deleted, (std::vector<std::string>{"SCS/old/gone.raw", "SCS/stale.raw"}));
    EXPECT_EQ(engine->snapshot(kScsId).last_result.outcome, LastResult::Outcome::Success);
}

TEST_F(EngineTest, PlanReachesTheAdapterWithBandwidthLimit) {
    auto def = scs();
    def.bandwidth_limit = 500;
    def.include_filter = "*.raw";
    store->put(def);
    script->candidates.push_back({"b.txt", 5, util::now() - 3600, false});
    boot(baseConfig());

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return script->copies.load() == 1; }));

    std::scoped_lock lock(script->planMutex);
    EXPECT_EQ(script->lastPlan.paths(), std::vector<std::string>{"a.raw"});
    ASSERT_FALSE(script->lastLimit.isUnlimited());
    EXPECT_EQ(*script->lastLimit.kbps, 500u);
}

TEST_F(EngineTest, FailedConnectionTestLeavesErrorAndFiresNoHooks) {
    auto cfg = baseConfig();
    cfg.hooks = {{"runCollectionSystemTransfer", {"updateDataDashboard"}}};
    cfg.task_commands = {{"updateDataDashboard", {"dashboard"}}};
    script->report = {};
    script->report.fail("Source directory", "Unable to find source directory: /instrument");
    boot(std::move(cfg));

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return status() == Status::Error; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(runner->count("dashboard"), 0u);
    EXPECT_EQ(script->copies.load(), 0u);
    EXPECT_EQ(engine->snapshot(kScsId).last_result.reason, "Unable to find source directory: /instrument");
}

TEST_F(EngineTest, StopTerminatesTheRunningCopy) {
    auto cfg = baseConfig();
    cfg.hooks = {{"runCollectionSystemTransfer", {"updateDataDashboard"}}};
    cfg.task_commands = {{"updateDataDashboard", {"dashboard"}}};
    script->blockingHandle = std::make_shared<ovdm::test::FakeHandle>(900);
    boot(std::move(cfg));

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return engine->snapshot(kScsId).pid == 900; }));
    EXPECT_EQ(status(), Status::Running);

    EXPECT_FALSE(engine->stop(kScsId).empty());
    ASSERT_TRUE(waitUntil([&] { return status() == Status::Idle; }));

    EXPECT_EQ(script->blockingHandle->terminations(), 1u);
    EXPECT_EQ(engine->snapshot(kScsId).last_result.outcome, LastResult::Outcome::Cancelled);
    EXPECT_FALSE(engine->snapshot(kScsId).pid.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(runner->count("dashboard"), 0u);
}

TEST_F(EngineTest, ShutdownStopsCopiesInFlight) {
    script->blockingHandle = std::make_shared<ovdm::test::FakeHandle>(900);
    boot(baseConfig());

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return engine->snapshot(kScsId).pid == 900; }));

    const auto began = std::chrono::steady_clock::now();
    engine->shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::seconds(3));

    EXPECT_EQ(script->blockingHandle->terminations(), 1u);
    EXPECT_EQ(store->live(kScsId).status, Status::Idle);
    EXPECT_EQ(store->live(kScsId).last_result.outcome, LastResult::Outcome::Cancelled);
    EXPECT_FALSE(store->live(kScsId).pid.has_value());
}

TEST_F(EngineTest, StopOnIdleDefinitionChangesNothing) {
    boot(baseConfig());
    const auto savesBefore = store->saves();

    EXPECT_FALSE(engine->stop(kScsId).empty());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_EQ(status(), Status::Idle);
    EXPECT_EQ(store->saves(), savesBefore);
}

TEST_F(EngineTest, ManualRunIsRefusedWhileTheSystemIsOff) {
    auto voyage = store->voyageContext();
    voyage.system_on = false;
    store->setVoyage(voyage);
    boot(baseConfig());

    const auto result = engine->run(kScsId);
    EXPECT_EQ(result.status, sched::EnqueueStatus::Disabled);
    EXPECT_EQ(status(), Status::Idle);
}

TEST_F(EngineTest, ManualRunReportsUnknownDefinitions) {
    boot(baseConfig());
    EXPECT_EQ(engine->run(42).status, sched::EnqueueStatus::NotFound);
}

TEST_F(EngineTest, MissingLoweringIsReportedWithoutTouchingState) {
    auto def = scs();
    def.cruise_or_lowering = Scope::Lowering;
    store->put(def);
    boot(baseConfig());

    const auto result = engine->run(kScsId);
    EXPECT_EQ(result.status, sched::EnqueueStatus::ContextUnavailable);
    EXPECT_EQ(status(), Status::Idle);
}

TEST_F(EngineTest, ConnectionTestRunsSynchronously) {
    boot(baseConfig());

    const auto result = engine->test(kScsId);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.data.at("verdict"), "Pass");
    EXPECT_EQ(status(), Status::Idle);
    EXPECT_EQ(engine->snapshot(kScsId).last_result.outcome, LastResult::Outcome::TestPassed);
}

TEST_F(EngineTest, FailedConnectionTestDoesNotMarkTheDefinitionErrored) {
    script->report = {};
    script->report.fail("Source directory", "Unable to find source directory: /instrument");
    boot(baseConfig());

    const auto result = engine->test(kScsId);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.data.at("reason"), "Unable to find source directory: /instrument");
    EXPECT_EQ(status(), Status::Idle);
}

TEST_F(EngineTest, PostHookCommandsAreMatchedByTransferName) {
    auto cfg = baseConfig();
    cfg.hooks = {{"runCollectionSystemTransfer", {"postCollectionSystemTransfer"}}};
    config::PostHookEntry scsHooks, otherHooks;
    scsHooks.transfer_name = "SCS";
    scsHooks.commands.push_back({"notify", {"notify", "{cruiseID}", "{newFiles}"}});
    otherHooks.transfer_name = "EM302";
    otherHooks.commands.push_back({"other", {"other"}});
    cfg.post_hook_commands["postCollectionSystemTransfer"] = {scsHooks, otherHooks};
    boot(std::move(cfg));

    ASSERT_TRUE(engine->run(kScsId).queued());
    ASSERT_TRUE(waitUntil([&] { return runner->count("notify") == 1; }));

    const auto call = runner->calls().front();
    ASSERT_GE(call.argv.size(), 3u);
    EXPECT_EQ(call.argv[1], "FK001");
    EXPECT_EQ(call.argv[2], "SCS/a.raw");
    EXPECT_EQ(runner->count("other"), 0u);
}

TEST_F(EngineTest, DefinitionChangedQueuesARebuild) {
    auto cfg = baseConfig();
    cfg.task_commands = {{"rebuildCruiseDirectory", {"rebuild"}}};
    boot(std::move(cfg));

    const auto handle = engine->definitionChanged(kScsId);
    EXPECT_TRUE(handle.starts_with("rebuildCruiseDirectory:"));
    ASSERT_TRUE(waitUntil([&] { return runner->count("rebuild") == 1; }));
}

TEST_F(EngineTest, BootResetsStaleInFlightStates) {
    auto def = scs();
    def.live.status = Status::Running;
    def.live.pid = 1234;
    store->put(def);

    boot(baseConfig());
    EXPECT_EQ(status(), Status::Idle);
    EXPECT_FALSE(store->live(kScsId).pid.has_value());
}

TEST(WorkerPools, UnknownOrEmptyPoolsAreRejected) {
    EXPECT_THROW((void)runtime::poolSizes({{"reticulateSplines", 2}}), std::invalid_argument);
    EXPECT_THROW((void)runtime::poolSizes({{"runCruiseDataTransfer", 0}}), std::invalid_argument);

    const auto sizes = runtime::poolSizes({{"runCruiseDataTransfer", 4}});
    EXPECT_EQ(sizes.at(TaskKind::RunCruiseDataTransfer), 4u);
    EXPECT_EQ(sizes.at(TaskKind::RunCollectionSystemTransfer), 2u);
    EXPECT_EQ(sizes.at(TaskKind::StopJob), 1u);
}

TEST(HookTable, DefaultTableIsValid) {
    const auto table = hooks::Table::fromConfig(config::Config::defaultHooks());
    const auto& followOns = table.followOns(TaskKind::RunCollectionSystemTransfer);
    ASSERT_EQ(followOns.size(), 3u);
    EXPECT_EQ(followOns[0], TaskKind::UpdateDataDashboard);
    EXPECT_TRUE(table.followOns(TaskKind::UpdateMD5Summary).empty());
}

TEST(HookTable, CyclesAreRejected) {
    EXPECT_THROW(hooks::Table::fromConfig({
        {"updateDataDashboard", {"updateMD5Summary"}},
        {"updateMD5Summary", {"updateDataDashboard"}}
    }), std::invalid_argument);

    EXPECT_THROW(hooks::Table::fromConfig({{"updateMD5Summary", {"updateMD5Summary"}}}), std::invalid_argument);
}

TEST(HookTable, UnknownTaskNamesAreRejected) {
    EXPECT_THROW(hooks::Table::fromConfig({{"runCollectionSystemTransfer", {"emailCaptain"}}}), std::invalid_argument);
}
