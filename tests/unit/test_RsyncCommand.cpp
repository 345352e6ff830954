#include <gtest/gtest.h>

#include "protocols/RsyncCommand.hpp"

#include <algorithm>

using namespace ovdm::protocols;
using namespace ovdm::types;

namespace {

bool contains(const std::vector<std::string>& argv, const std::string& arg) {
    return std::ranges::find(argv, arg) != argv.end();
}

bool anyStartsWith(const std::vector<std::string>& argv, const std::string& prefix) {
    return std::ranges::any_of(argv, [&](const std::string& a) { return a.starts_with(prefix); });
}

}

TEST(RsyncCommand, ZeroBandwidthMeansNoCap) {
    const auto limit = BandwidthLimit::of(0);
    EXPECT_TRUE(limit.isUnlimited());

    const auto argv = RsyncCommand("/src/", "/dest").bandwidth(limit).argv();
    EXPECT_FALSE(anyStartsWith(argv, "--bwlimit"));
}

TEST(RsyncCommand, ConcreteBandwidthIsPassedThrough) {
    const auto limit = BandwidthLimit::of(500);
    ASSERT_FALSE(limit.isUnlimited());
    EXPECT_EQ(*limit.kbps, 500u);

    const auto argv = RsyncCommand("/src/", "/dest").bandwidth(limit).argv();
    EXPECT_TRUE(contains(argv, "--bwlimit=500"));
}

TEST(RsyncCommand, FlagsAppearInStableOrder) {
    const auto argv = RsyncCommand("/src/", "/dest")
        .wrapper({"sshpass", "-e"})
        .skipEmptyDirs(true)
        .skipEmptyFiles(true)
        .bandwidth(BandwidthLimit::of(100))
        .removeSourceFiles(true)
        .deleteExtraneous(true)
        .remoteShell("ssh -o StrictHostKeyChecking=no")
        .filesFrom("/tmp/list.txt")
        .argv();

    const std::vector<std::string> expected{
        "sshpass", "-e", "rsync", "-triv", "--protect-args", "-m", "--min-size=1", "--bwlimit=100",
        "--remove-source-files", "-e", "ssh -o StrictHostKeyChecking=no",
        "--files-from=/tmp/list.txt", "/src/", "/dest"
    };
    EXPECT_EQ(argv, expected);
}

TEST(RsyncCommand, DeletionPassKeepsTheConnectionButTransfersNothing) {
    auto cmd = RsyncCommand("/src/", "ovdm@shore:/backup");
    cmd.wrapper({"sshpass", "-e"})
        .bandwidth(BandwidthLimit::of(100))
        .deleteExtraneous(true)
        .remoteShell("ssh -o BatchMode=no")
        .filesFrom("/tmp/list.txt");

    ASSERT_TRUE(cmd.deletesExtraneous());
    const std::vector<std::string> expected{
        "sshpass", "-e", "rsync", "-ri", "--protect-args", "--delete", "--existing", "--ignore-existing",
        "-e", "ssh -o BatchMode=no", "/src/", "ovdm@shore:/backup"
    };
    EXPECT_EQ(cmd.deletionArgv(), expected);
    EXPECT_FALSE(RsyncCommand("/a/", "/b").deletesExtraneous());
}

TEST(RsyncCommand, DaemonUrlsSuppressTheMotd) {
    const auto argv = RsyncCommand("rsync://user@host/module/", "/dest").passwordFile("/tmp/pw").argv();

    EXPECT_TRUE(contains(argv, "--no-motd"));
    EXPECT_TRUE(contains(argv, "--password-file=/tmp/pw"));
    EXPECT_FALSE(contains(RsyncCommand("/a", "/b").argv(), "--no-motd"));
}

TEST(RsyncReport, SortsItemizedLinesIntoNewUpdatedAndDeleted) {
    RsyncReport report;
    report.consume(">f+++++++++ nav/gps.log");
    report.consume(">f.st...... nav/met.log");
    report.consume("cd+++++++++ nav/");
    report.consume("*deleting   old.dat");
    report.consume("");

    EXPECT_EQ(report.new_files, std::vector<std::string>{"nav/gps.log"});
    EXPECT_EQ(report.updated_files, std::vector<std::string>{"nav/met.log"});
    EXPECT_EQ(report.deleted_files, std::vector<std::string>{"old.dat"});
    EXPECT_TRUE(report.failures.empty());
}

TEST(RsyncReport, RecordsPerFileFailures) {
    RsyncReport report;
    report.consume("rsync: send_files failed to open \"/src/locked.dat\": Permission denied (13)");
    report.consume("file has vanished: \"/src/tmp.part\"");
    report.consume("rsync error: some files/attrs were not transferred (code 23)");

    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].path, "/src/locked.dat");
    EXPECT_EQ(report.failures[0].reason, "Permission denied (13)");
    EXPECT_EQ(report.failures[1].path, "/src/tmp.part");
    EXPECT_EQ(report.failures[1].reason, "file has vanished");
    EXPECT_EQ(report.last_error, "rsync error: some files/attrs were not transferred (code 23)");
}

TEST(RsyncExit, Classification) {
    ovdm::process::Result r;

    r.exit_code = 0;
    EXPECT_EQ(classifyRsyncExit(r), CopyResult::Status::Success);
    r.exit_code = 23;
    EXPECT_EQ(classifyRsyncExit(r), CopyResult::Status::Partial);
    r.exit_code = 24;
    EXPECT_EQ(classifyRsyncExit(r), CopyResult::Status::Partial);
    r.exit_code = 20;
    EXPECT_EQ(classifyRsyncExit(r), CopyResult::Status::Interrupted);
    r.exit_code = 12;
    EXPECT_EQ(classifyRsyncExit(r), CopyResult::Status::Fatal);

    r.exit_code = -1;
    r.signaled = true;
    r.term_signal = 15;
    EXPECT_EQ(classifyRsyncExit(r), CopyResult::Status::Interrupted);
}

TEST(RsyncListing, ParsesFilesAndKeepsOnlyLeafDirectories) {
    const std::vector<std::string> lines{
        "drwxr-xr-x          4,096 2023/11/14 20:00:00 .",
        "drwxr-xr-x          4,096 2023/11/14 20:00:00 nav",
        "-rw-r--r--      1,234,567 2023/11/14 21:30:15 nav/gps.log",
        "drwxr-xr-x          4,096 2023/11/14 20:00:00 empty",
        "garbage line",
    };

    const auto entries = parseRsyncListing(lines);
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].rel_path, "nav/gps.log");
    EXPECT_EQ(entries[0].size, 1234567u);
    EXPECT_EQ(entries[0].mtime, 1699997415);
    EXPECT_FALSE(entries[0].is_dir);

    EXPECT_EQ(entries[1].rel_path, "empty");
    EXPECT_TRUE(entries[1].is_dir);
    EXPECT_EQ(entries[1].size, 0u);
}

TEST(RsyncListing, KeepsSpacesInNames) {
    const auto entries = parseRsyncListing({"-rw-r--r--             12 2023/11/14 21:30:15 my file.txt"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].rel_path, "my file.txt");
}

TEST(ShellQuote, EscapesSingleQuotes) {
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
}
