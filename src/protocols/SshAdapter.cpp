#include "protocols/SshAdapter.hpp"
#include "protocols/RsyncCommand.hpp"
#include "util/TempDir.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::types;
using namespace ovdm::log;

std::string SshAdapter::host() const {
    const auto& c = target_.credentials;
    return c.user.empty() ? c.server : c.user + "@" + c.server;
}

std::vector<std::string> SshAdapter::sshOptions() const {
    std::vector<std::string> opts{"ssh", "-o", "StrictHostKeyChecking=no", "-o", "ConnectTimeout=10"};
    if (passwordAuth()) {
        opts.emplace_back("-o");
        opts.emplace_back("PubkeyAuthentication=no");
    } else {
        opts.emplace_back("-o");
        opts.emplace_back("BatchMode=yes");
    }
    return opts;
}

std::vector<std::string> SshAdapter::wrapper() const {
    if (!passwordAuth()) return {};
    return {"sshpass", "-e"};
}

std::map<std::string, std::string> SshAdapter::env() const {
    if (!passwordAuth()) return {};
    return {{"SSHPASS", target_.credentials.password}};
}

ovdm::process::Result SshAdapter::remote(const std::string& command) const {
    auto argv = wrapper();
    for (auto& opt : sshOptions()) argv.push_back(std::move(opt));
    argv.push_back(host());
    argv.push_back(command);
    return runQuiet(argv, env());
}

TestReport SshAdapter::test() {
    TestReport report;
    const bool pull = target_.pull();
    const std::string side = pull ? "Source directory" : "Destination directory";
    const auto& dir = target_.remoteDir();

    if (passwordAuth() && target_.credentials.password.empty()) {
        const auto reason = "No password configured and key authentication is disabled";
        failRemaining(report, pull ? std::vector<std::string>{"SSH connection", side}
                                   : std::vector<std::string>{"SSH connection", side, "Write test"}, reason);
        return report;
    }

    if (!remote("ls").ok()) {
        const auto reason = fmt::format("Unable to connect to SSH server: {} as {}", target_.credentials.server, target_.credentials.user);
        failRemaining(report, pull ? std::vector<std::string>{"SSH connection", side}
                                   : std::vector<std::string>{"SSH connection", side, "Write test"}, reason);
        return report;
    }
    report.pass("SSH connection");

    if (!remote("ls " + shellQuote(dir)).ok()) {
        const auto reason = fmt::format("Unable to find {}: {}", pull ? "source directory" : "destination directory", dir);
        report.fail(side, reason);
        if (!pull) report.fail("Write test", reason);
        return report;
    }
    report.pass(side);

    if (pull) return report;

    const auto probe = shellQuote((fs::path(dir) / "writeTest.txt").string());
    if (!remote("touch " + probe).ok() || !remote("rm " + probe).ok())
        report.fail("Write test", fmt::format("Unable to write to: {} on SSH server: {}", dir, target_.credentials.server));
    else
        report.pass("Write test");

    return report;
}

std::vector<FileEntry> SshAdapter::enumerate() {
    if (!target_.pull()) return enumerateLocal(target_.source_dir);

    auto argv = wrapper();
    argv.insert(argv.end(), {"rsync", "-r", "--list-only", "--protect-args", "-e", fmt::format("{}", fmt::join(sshOptions(), " ")),
                             host() + ":" + target_.source_dir + "/"});

    const auto res = runQuiet(argv, env());
    if (!res.ok() && res.exit_code != 24) {
        const auto detail = res.output.empty() ? "exit code " + std::to_string(res.exit_code) : res.output.back();
        throw std::runtime_error("Unable to list " + host() + ":" + target_.source_dir + ": " + detail);
    }
    return parseRsyncListing(res.output);
}

CopyResult SshAdapter::copy(const Plan& plan, const BandwidthLimit& limit, const SpawnObserver& onSpawn) {
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

    util::TempDir scratch("ovdm-ssh");
    RsyncCommand cmd(pull ? host() + ":" + target_.source_dir + "/" : target_.source_dir + "/",
                     pull ? target_.dest_dir : host() + ":" + target_.dest_dir);
    cmd.bandwidth(limit)
        .removeSourceFiles(target_.remove_source_files)
        .skipEmptyDirs(target_.skip_empty_dirs)
        .skipEmptyFiles(target_.skip_empty_files)
        .deleteExtraneous(target_.sync_to_dest)
        .filesFrom(writeFileList(plan, scratch.path()))
        .remoteShell(fmt::format("{}", fmt::join(sshOptions(), " ")))
        .wrapper(wrapper());

    Registry::transfer()->info("[{}] Transferring {} item(s) over ssh to {}", target_.name, plan.include.size(), host());
    return runRsync(cmd, plan, onSpawn, env());
}
