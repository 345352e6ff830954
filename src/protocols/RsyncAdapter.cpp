#include "protocols/RsyncAdapter.hpp"
#include "protocols/RsyncCommand.hpp"
#include "util/TempDir.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::types;
using namespace ovdm::log;

namespace {

bool reachable(const ovdm::process::Result& res) {
    return !res.signaled && (res.exit_code == 0 || res.exit_code == 24);
}

}

bool RsyncAdapter::anonymous() const {
    const auto& user = target_.credentials.user;
    return user.empty() || user == "anonymous";
}

std::string RsyncAdapter::url(const std::string& path) const {
    const auto& c = target_.credentials;
    std::string out = "rsync://";
    if (!c.user.empty()) out += c.user + "@";
    out += c.server;
    if (!path.empty() && !path.starts_with("/")) out += "/";
    out += path;
    return out;
}

std::optional<fs::path> RsyncAdapter::writePasswordFile(const fs::path& dir) const {
    if (anonymous()) return std::nullopt;
    const auto path = dir / "passwordFile";
    util::writeFile(path, target_.credentials.password);
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    return path;
}

std::vector<std::string> RsyncAdapter::probe(const std::optional<fs::path>& passwordFile) const {
    std::vector<std::string> argv{"rsync", "--no-motd", "--contimeout=5"};
    if (passwordFile) argv.push_back("--password-file=" + passwordFile->string());
    return argv;
}

TestReport RsyncAdapter::test() {
    TestReport report;
    const bool pull = target_.pull();
    const std::string side = pull ? "Source directory" : "Destination directory";
    const auto& server = target_.credentials.server;
    const auto& user = target_.credentials.user;

    util::TempDir scratch("ovdm-rsync");

    std::optional<fs::path> passwordFile;
    try {
        passwordFile = writePasswordFile(scratch.path());
    } catch (const std::exception& e) {
        const auto reason = fmt::format("Unable to create temporary rsync password file: {}", e.what());
        report.fail("Writing temporary rsync password file", reason);
        failRemaining(report, pull ? std::vector<std::string>{"Rsync connection", side}
                                   : std::vector<std::string>{"Rsync connection", side, "Write test"}, reason);
        return report;
    }

    auto argv = probe(passwordFile);
    argv.push_back(url());
    if (!reachable(runQuiet(argv))) {
        const auto reason = fmt::format("Could not connect to rsync server: {} as {}", server, user);
        failRemaining(report, pull ? std::vector<std::string>{"Rsync connection", side}
                                   : std::vector<std::string>{"Rsync connection", side, "Write test"}, reason);
        return report;
    }
    report.pass("Rsync connection");

    const auto& dir = target_.remoteDir();
    argv = probe(passwordFile);
    argv.push_back(url(dir));
    if (!reachable(runQuiet(argv))) {
        const auto reason = fmt::format("Unable to find {}: {} on the Rsync Server: {}",
                                        pull ? "source directory" : "destination directory", dir, server);
        report.fail(side, reason);
        if (!pull) report.fail("Write test", reason);
        return report;
    }
    report.pass(side);

    if (pull) return report;

    // write_test.txt stays behind on the daemon; only the local copy is removed.
    const auto probeDir = scratch.path() / "write_test";
    fs::create_directories(probeDir);
    const auto probeFile = probeDir / "write_test.txt";
    util::writeFile(probeFile, "this is a write test file used by OpenVDM to determine if destination is writable\n");

    argv = probe(passwordFile);
    argv.emplace_back("--remove-source-files");
    argv.push_back(probeFile.string());
    argv.push_back(url(dir));
    if (!reachable(runQuiet(argv))) report.fail("Write test", fmt::format("Unable to write to: {} on the Rsync Server: {}", dir, server));
    else report.pass("Write test");

    return report;
}

std::vector<FileEntry> RsyncAdapter::enumerate() {
    if (!target_.pull()) return enumerateLocal(target_.source_dir);

    util::TempDir scratch("ovdm-rsync");
    auto argv = probe(writePasswordFile(scratch.path()));
    argv.emplace_back("-r");
    argv.emplace_back("--list-only");
    argv.push_back(url(target_.source_dir) + "/");

    const auto res = runQuiet(argv);
    if (!reachable(res)) {
        const auto detail = res.output.empty() ? "exit code " + std::to_string(res.exit_code) : res.output.back();
        throw std::runtime_error("Unable to list " + url(target_.source_dir) + ": " + detail);
    }
    return parseRsyncListing(res.output);
}

CopyResult RsyncAdapter::copy(const Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) {
    if (plan.empty() && !target_.sync_to_dest) return {};

    const bool pull = target_.pull();
    if (pull) {
        std::error_code ec;
        fs::create_directories(target_.dest_dir, ec);
        if (ec) {
            CopyResult out;
            out.status = CopyResult::Status::Fatal;
            out.error = "Unable to create destination directory " + target_.dest_dir + ": " + ec.message();
            return out;
        }
    }

    util::TempDir scratch("ovdm-rsync");
    const auto passwordFile = writePasswordFile(scratch.path());

    RsyncCommand cmd(pull ? url(target_.source_dir) + "/" : target_.source_dir + "/",
                     pull ? target_.dest_dir : url(target_.dest_dir));
    cmd.bandwidth(limit)
        .removeSourceFiles(target_.remove_source_files)
        .skipEmptyDirs(target_.skip_empty_dirs)
        .skipEmptyFiles(target_.skip_empty_files)
        .deleteExtraneous(target_.sync_to_dest)
        .filesFrom(writeFileList(plan, scratch.path()));
    if (passwordFile) cmd.passwordFile(*passwordFile);

    Registry::transfer()->info("[{}] Transferring {} item(s) via rsync daemon {}", target_.name, plan.include.size(),
                               target_.credentials.server);
    return runRsync(cmd, plan, onSpawn);
}
