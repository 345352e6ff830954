#include <gtest/gtest.h>

#include "protocols/LocalAdapter.hpp"
#include "protocols/NfsAdapter.hpp"
#include "protocols/RsyncAdapter.hpp"
#include "protocols/SmbAdapter.hpp"
#include "protocols/SshAdapter.hpp"
#include "support/FakeProcess.hpp"
#include "util/TempDir.hpp"
#include "util/files.hpp"

#include <algorithm>

using namespace ovdm;
using namespace ovdm::protocols;
using namespace ovdm::types;
using ovdm::test::RecordingRunner;

namespace fs = std::filesystem;

namespace {

std::vector<std::string> partNames(const TestReport& report) {
    std::vector<std::string> names;
    for (const auto& p : report.parts) names.push_back(p.name);
    return names;
}

bool allFailed(const TestReport& report) {
    return std::ranges::all_of(report.parts, [](const ReportPart& p) { return p.result == ReportPart::Result::Fail; });
}

process::Result exited(const int code, std::vector<std::string> output = {}) {
    process::Result r;
    r.exit_code = code;
    r.output = std::move(output);
    return r;
}

class AdapterTest : public ::testing::Test {
protected:
    util::TempDir src{"ovdm-src"};
    util::TempDir dest{"ovdm-dest"};
    std::shared_ptr<RecordingRunner> runner = std::make_shared<RecordingRunner>();

    [[nodiscard]] Target pullTarget(const TransferType type = TransferType::LocalDirectory) const {
        Target t;
        t.id = 1;
        t.name = "SCS";
        t.type = type;
        t.direction = filter::Direction::Pull;
        t.source_dir = src.path().string();
        t.dest_dir = dest.path().string();
        return t;
    }

    [[nodiscard]] Target pushTarget(const TransferType type = TransferType::LocalDirectory) const {
        auto t = pullTarget(type);
        t.name = "Backup";
        t.direction = filter::Direction::Push;
        return t;
    }
};

Plan planOf(std::initializer_list<FileEntry> files) {
    Plan plan;
    for (const auto& f : files) {
        plan.include.push_back(f);
        plan.total_bytes += f.size;
    }
    return plan;
}

}

TEST_F(AdapterTest, LocalPullPassesForAnExistingSource) {
    LocalAdapter adapter(pullTarget(), runner);
    const auto report = adapter.test();

    EXPECT_TRUE(report.passed());
    EXPECT_EQ(partNames(report), std::vector<std::string>{"Source directory"});
}

TEST_F(AdapterTest, LocalPullFailsEveryPartForAMissingSource) {
    auto target = pullTarget();
    target.source_dir = (src.path() / "missing").string();
    target.remove_source_files = true;
    target.local_dir_is_mount_point = true;

    LocalAdapter adapter(target, runner);
    const auto report = adapter.test();

    EXPECT_FALSE(report.passed());
    EXPECT_EQ(partNames(report), (std::vector<std::string>{"Source directory", "Source directory is a mountpoint", "Write test"}));
    EXPECT_TRUE(allFailed(report));
    EXPECT_NE(report.failureReason().find("Unable to find source directory"), std::string::npos);
}

TEST_F(AdapterTest, LocalPushChecksTheDestinationIsWritable) {
    LocalAdapter adapter(pushTarget(), runner);
    const auto report = adapter.test();

    EXPECT_TRUE(report.passed());
    EXPECT_EQ(partNames(report), (std::vector<std::string>{"Destination directory", "Write test"}));
}

TEST_F(AdapterTest, LocalEnumerateListsFilesAndEmptyDirectories) {
    util::writeFile(src.path() / "nav" / "gps.log", "12345");
    fs::create_directories(src.path() / "empty");

    LocalAdapter adapter(pullTarget(), runner);
    auto entries = adapter.enumerate();
    std::ranges::sort(entries, {}, &FileEntry::rel_path);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].rel_path, "empty");
    EXPECT_TRUE(entries[0].is_dir);
    EXPECT_EQ(entries[1].rel_path, "nav/gps.log");
    EXPECT_EQ(entries[1].size, 5u);
}

TEST_F(AdapterTest, LocalCopyRunsRsyncOverThePlan) {
    runner->script("rsync", exited(0, {">f+++++++++ a.raw", ">f.st...... b.raw"}));

    LocalAdapter adapter(pullTarget(), runner);
    std::shared_ptr<process::Handle> spawned;
    const auto result = adapter.copy(planOf({{"a.raw", 10, 0, false}, {"b.raw", 20, 0, false}}),
                                     BandwidthLimit::of(500),
                                     [&](const std::shared_ptr<process::Handle>& h) { spawned = h; });

    EXPECT_EQ(result.status, CopyResult::Status::Success);
    EXPECT_EQ(result.new_files, std::vector<std::string>{"a.raw"});
    EXPECT_EQ(result.updated_files, std::vector<std::string>{"b.raw"});
    EXPECT_EQ(result.file_count, 2u);
    EXPECT_EQ(result.bytes_moved, 30u);
    ASSERT_NE(spawned, nullptr);

    const auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    const auto& argv = calls[0].argv;
    EXPECT_EQ(argv.front(), "rsync");
    EXPECT_NE(std::ranges::find(argv, "--bwlimit=500"), argv.end());
    EXPECT_EQ(argv[argv.size() - 2], src.path().string() + "/");
    EXPECT_EQ(argv.back(), dest.path().string());
    EXPECT_TRUE(std::ranges::any_of(argv, [](const std::string& a) { return a.starts_with("--files-from="); }));
}

TEST_F(AdapterTest, LocalCopyReportsPartialFailuresRelativeToTheSource) {
    const auto locked = (src.path() / "locked.dat").string();
    runner->script("rsync", exited(23, {
        ">f+++++++++ a.raw",
        "rsync: send_files failed to open \"" + locked + "\": Permission denied (13)"
    }));

    LocalAdapter adapter(pullTarget(), runner);
    const auto result = adapter.copy(planOf({{"a.raw", 10, 0, false}, {"locked.dat", 5, 0, false}}),
                                     BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.status, CopyResult::Status::Partial);
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].path, "locked.dat");
}

TEST_F(AdapterTest, EmptyPlanSpawnsNothing) {
    LocalAdapter adapter(pullTarget(), runner);
    const auto result = adapter.copy(Plan{}, BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.status, CopyResult::Status::Success);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(AdapterTest, FatalRsyncExitCarriesTheLastError) {
    runner->script("rsync", exited(11, {"rsync error: error in file IO (code 11) at receiver.c(374)"}));

    LocalAdapter adapter(pullTarget(), runner);
    const auto result = adapter.copy(planOf({{"a.raw", 10, 0, false}}), BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.status, CopyResult::Status::Fatal);
    EXPECT_EQ(result.error, "rsync error: error in file IO (code 11) at receiver.c(374)");
}

TEST_F(AdapterTest, MirrorPushRunsADeletionPassAfterTheCopy) {
    runner->script("rsync", exited(0, {">f+++++++++ a.raw"}));
    runner->script("rsync", exited(0, {"*deleting   stale.raw"}), "--existing");

    auto target = pushTarget();
    target.sync_to_dest = true;
    LocalAdapter adapter(target, runner);
    const auto result = adapter.copy(planOf({{"a.raw", 10, 0, false}}), BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.status, CopyResult::Status::Success);
    EXPECT_EQ(result.new_files, std::vector<std::string>{"a.raw"});
    EXPECT_EQ(result.deleted_files, std::vector<std::string>{"stale.raw"});

    const auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(std::ranges::find(calls[0].argv, "--delete"), calls[0].argv.end());

    const auto& argv = calls[1].argv;
    EXPECT_NE(std::ranges::find(argv, "--delete"), argv.end());
    EXPECT_NE(std::ranges::find(argv, "--ignore-existing"), argv.end());
    EXPECT_FALSE(std::ranges::any_of(argv, [](const std::string& a) { return a.starts_with("--files-from="); }));
    EXPECT_EQ(argv[argv.size() - 2], src.path().string() + "/");
    EXPECT_EQ(argv.back(), dest.path().string());
}

TEST_F(AdapterTest, MirrorPushWithNothingNewStillRemovesExtraneousFiles) {
    runner->script("rsync", exited(0, {"*deleting   old/gone.raw"}), "--existing");

    auto target = pushTarget();
    target.sync_to_dest = true;
    LocalAdapter adapter(target, runner);
    const auto result = adapter.copy(Plan{}, BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.deleted_files, std::vector<std::string>{"old/gone.raw"});
    EXPECT_EQ(runner->count("rsync"), 2u);
}

TEST_F(AdapterTest, FailedDeletionPassDowngradesTheCopyToPartial) {
    runner->script("rsync", exited(12, {"rsync error: error in rsync protocol data stream (code 12)"}), "--existing");

    auto target = pushTarget();
    target.sync_to_dest = true;
    LocalAdapter adapter(target, runner);
    const auto result = adapter.copy(planOf({{"a.raw", 10, 0, false}}), BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.status, CopyResult::Status::Partial);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].path, dest.path().string());
    EXPECT_NE(result.failures[0].reason.find("code 12"), std::string::npos);
}

TEST_F(AdapterTest, PullNeverRunsADeletionPass) {
    auto target = pullTarget();
    target.sync_to_dest = false;
    LocalAdapter adapter(target, runner);
    (void)adapter.copy(planOf({{"a.raw", 10, 0, false}}), BandwidthLimit::unlimited(), {});

    EXPECT_EQ(runner->count("rsync"), 1u);
}

TEST_F(AdapterTest, MirrorPushWithRealRsyncLeavesOnlySourceFiles) {
    if (!fs::exists("/usr/bin/rsync") && !fs::exists("/bin/rsync") && !fs::exists("/usr/local/bin/rsync"))
        GTEST_SKIP() << "rsync is not installed";

    util::writeFile(src.path() / "a.raw", "aaaa");
    util::writeFile(src.path() / "sub" / "b.raw", "bbbb");
    util::writeFile(src.path() / "deferred.raw", "still writing");
    util::writeFile(dest.path() / "stale.raw", "old");
    util::writeFile(dest.path() / "sub" / "old.raw", "old");
    util::writeFile(dest.path() / "deferred.raw", "previous copy");

    auto target = pushTarget();
    target.sync_to_dest = true;
    LocalAdapter adapter(target, std::make_shared<process::PosixRunner>());
    const auto result = adapter.copy(planOf({{"a.raw", 4, 0, false}, {"sub/b.raw", 4, 0, false}}),
                                     BandwidthLimit::unlimited(), {});

    EXPECT_EQ(result.status, CopyResult::Status::Success);
    EXPECT_TRUE(fs::exists(dest.path() / "a.raw"));
    EXPECT_TRUE(fs::exists(dest.path() / "sub" / "b.raw"));
    EXPECT_TRUE(fs::exists(dest.path() / "deferred.raw"));
    EXPECT_FALSE(fs::exists(dest.path() / "stale.raw"));
    EXPECT_FALSE(fs::exists(dest.path() / "sub" / "old.raw"));

    auto deleted = result.deleted_files;
    std::ranges::sort(deleted);
    EXPECT_EQ(deleted, (std::vector<std::string>{"stale.raw", "sub/old.raw"}));
}

TEST_F(AdapterTest, UnreachableSmbServerFailsEveryDependentPart) {
    runner->script("smbclient", exited(1, {"session setup failed: NT_STATUS_LOGON_FAILURE"}));

    auto target = pullTarget(TransferType::SmbShare);
    target.source_dir = "/raw";
    target.credentials.server = "10.0.0.5";
    target.credentials.share = "data";
    target.credentials.user = "survey";
    target.credentials.password = "secret";

    SmbAdapter adapter(target, runner);
    const auto report = adapter.test();

    EXPECT_FALSE(report.passed());
    EXPECT_EQ(partNames(report), (std::vector<std::string>{"SMB server", "SMB share", "Source directory"}));
    EXPECT_TRUE(allFailed(report));
    EXPECT_EQ(report.parts[0].reason, report.parts[2].reason);

    EXPECT_EQ(runner->count("smbclient"), 1u);
    EXPECT_EQ(runner->count("mount"), 0u);

    const auto argv = runner->calls().front().argv;
    EXPECT_NE(std::ranges::find(argv, "-A"), argv.end());
    EXPECT_EQ(std::ranges::find(argv, "secret"), argv.end());
}

TEST_F(AdapterTest, SshPasswordAuthGoesThroughTheEnvironment) {
    auto target = pushTarget(TransferType::SshServer);
    target.dest_dir = "/backup";
    target.credentials.server = "shore.example.org";
    target.credentials.user = "ovdm";
    target.credentials.password = "hunter2";

    SshAdapter adapter(target, runner);
    const auto report = adapter.test();

    EXPECT_TRUE(report.passed());
    EXPECT_EQ(partNames(report), (std::vector<std::string>{"SSH connection", "Destination directory", "Write test"}));

    for (const auto& call : runner->calls()) {
        EXPECT_EQ(call.argv.front(), "sshpass");
        EXPECT_EQ(call.env.at("SSHPASS"), "hunter2");
        EXPECT_EQ(std::ranges::find(call.argv, "hunter2"), call.argv.end());
    }
}

TEST_F(AdapterTest, SshWithoutPasswordOrKeyFailsWithoutConnecting) {
    auto target = pullTarget(TransferType::SshServer);
    target.credentials.server = "shore.example.org";
    target.credentials.user = "ovdm";

    SshAdapter adapter(target, runner);
    const auto report = adapter.test();

    EXPECT_FALSE(report.passed());
    EXPECT_EQ(partNames(report), (std::vector<std::string>{"SSH connection", "Source directory"}));
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(AdapterTest, SshPullEnumeratesThroughRsyncListing) {
    auto target = pullTarget(TransferType::SshServer);
    target.source_dir = "/data";
    target.credentials.server = "ship.example.org";
    target.credentials.user = "ovdm";
    target.credentials.use_ssh_key = true;
    runner->script("rsync", exited(0, {"-rw-r--r--             12 2023/11/14 21:30:15 raw/a.raw"}));

    SshAdapter adapter(target, runner);
    const auto entries = adapter.enumerate();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].rel_path, "raw/a.raw");
    EXPECT_EQ(runner->calls().front().argv.back(), "ovdm@ship.example.org:/data/");
}

TEST(AdapterFactory, PicksTheAdapterForTheTransferType) {
    DefaultAdapterFactory factory(std::make_shared<RecordingRunner>());

    filter::ResolvedTransfer transfer;
    transfer.definition.name = "X";
    transfer.source_dir = "/a";
    transfer.dest_dir = "/b";

    transfer.definition.transfer_type = TransferType::LocalDirectory;
    EXPECT_NE(dynamic_cast<LocalAdapter*>(factory.create(transfer).get()), nullptr);
    transfer.definition.transfer_type = TransferType::RsyncServer;
    EXPECT_NE(dynamic_cast<RsyncAdapter*>(factory.create(transfer).get()), nullptr);
    transfer.definition.transfer_type = TransferType::SmbShare;
    EXPECT_NE(dynamic_cast<SmbAdapter*>(factory.create(transfer).get()), nullptr);
    transfer.definition.transfer_type = TransferType::SshServer;
    EXPECT_NE(dynamic_cast<SshAdapter*>(factory.create(transfer).get()), nullptr);
    transfer.definition.transfer_type = TransferType::NfsShare;
    EXPECT_NE(dynamic_cast<NfsAdapter*>(factory.create(transfer).get()), nullptr);
}
