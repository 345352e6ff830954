#include "protocols/SmbAdapter.hpp"
#include "util/TempDir.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

using namespace ovdm::protocols;
using namespace ovdm::types;
using namespace ovdm::log;

namespace {

std::string stripSlashes(std::string s) {
    while (s.starts_with("/")) s.erase(0, 1);
    while (s.ends_with("/")) s.pop_back();
    return s;
}

void writeSecret(const fs::path& path, const std::string& content) {
    ovdm::util::writeFile(path, content);
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
}

}

bool SmbAdapter::guest() const {
    const auto& user = target_.credentials.user;
    return user.empty() || user == "guest";
}

std::string SmbAdapter::unc() const {
    const auto& c = target_.credentials;
    auto out = "//" + stripSlashes(c.server);
    if (const auto share = stripSlashes(c.share); !share.empty()) out += "/" + share;
    return out;
}

std::optional<std::string> SmbAdapter::detectVersion() {
    if (version_) return version_;

    const auto& c = target_.credentials;
    util::TempDir scratch("ovdm-smb");

    std::vector<std::string> argv{"smbclient", "-L", "//" + stripSlashes(c.server), "-m", "SMB2", "-g"};
    if (!c.domain.empty()) argv.insert(argv.end(), {"-W", c.domain});
    if (guest()) {
        argv.emplace_back("-N");
    } else {
        const auto authFile = scratch.path() / "authFile";
        writeSecret(authFile, fmt::format("username = {}\npassword = {}\n", c.user, c.password));
        argv.insert(argv.end(), {"-A", authFile.string()});
    }

    const auto res = runQuiet(argv);
    const bool denied = std::ranges::any_of(res.output, [](const std::string& line) {
        return line.find("NT_STATUS") != std::string::npos;
    });
    if (!res.ok() || denied) {
        Registry::transfer()->warn("[{}] SMB server {} unreachable: {}", target_.name, c.server,
                                   res.output.empty() ? "no output" : res.output.back());
        return std::nullopt;
    }

    const bool smb1 = std::ranges::any_of(res.output, [](const std::string& line) {
        return line.starts_with("OS=[Windows 5.1]");
    });
    version_ = smb1 ? "1.0" : "2.1";
    return version_;
}

std::unique_ptr<Mount> SmbAdapter::mount(const bool writable) {
    auto mnt = std::make_unique<Mount>(runner_);

    const auto version = detectVersion();
    if (!version) {
        mnt->fail("SMB server " + target_.credentials.server + " is unreachable");
        return mnt;
    }

    const auto& c = target_.credentials;
    auto opts = fmt::format("{},vers={}", writable ? "rw" : "ro", *version);
    if (!c.domain.empty()) opts += ",domain=" + c.domain;

    fs::path credentials;
    if (guest()) {
        opts += ",guest";
    } else {
        credentials = mnt->scratch() / "credentials";
        writeSecret(credentials, fmt::format("username={}\npassword={}\n", c.user, c.password));
        opts += ",credentials=" + credentials.string();
    }

    mnt->attach({"mount", "-t", "cifs", unc(), mnt->point().string(), "-o", opts});

    if (!credentials.empty()) {
        std::error_code ec;
        fs::remove(credentials, ec);
    }
    return mnt;
}

TestReport SmbAdapter::test() {
    TestReport report;
    const auto& c = target_.credentials;
    const auto reason = fmt::format("Could not connect to SMB server: {} as {}", unc(), c.user);

    auto remaining = dirParts();
    remaining.insert(remaining.begin(), "SMB share");

    if (!detectVersion()) {
        report.fail("SMB server", reason);
        failRemaining(report, remaining, reason);
        return report;
    }
    report.pass("SMB server");

    const auto mnt = mount(writable());
    if (!mnt->mounted()) {
        failRemaining(report, remaining, reason + ": " + mnt->error());
        return report;
    }
    report.pass("SMB share");

    testMountedDir(report, *mnt, "SMB share");
    return report;
}
