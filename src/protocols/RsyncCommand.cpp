#include "protocols/RsyncCommand.hpp"

#include <charconv>
#include <ctime>
#include <fmt/format.h>
#include <iomanip>
#include <set>
#include <sstream>

using namespace ovdm::protocols;
using namespace ovdm::types;

RsyncCommand::RsyncCommand(std::string source, std::string dest)
    : source_(std::move(source)), dest_(std::move(dest)) {}

RsyncCommand& RsyncCommand::bandwidth(const BandwidthLimit& limit) {
    bandwidth_ = limit;
    return *this;
}

RsyncCommand& RsyncCommand::removeSourceFiles(const bool on) {
    removeSourceFiles_ = on;
    return *this;
}

RsyncCommand& RsyncCommand::skipEmptyDirs(const bool on) {
    skipEmptyDirs_ = on;
    return *this;
}

RsyncCommand& RsyncCommand::skipEmptyFiles(const bool on) {
    skipEmptyFiles_ = on;
    return *this;
}

RsyncCommand& RsyncCommand::deleteExtraneous(const bool on) {
    delete_ = on;
    return *this;
}

RsyncCommand& RsyncCommand::filesFrom(std::filesystem::path path) {
    filesFrom_ = std::move(path);
    return *this;
}

RsyncCommand& RsyncCommand::passwordFile(std::filesystem::path path) {
    passwordFile_ = std::move(path);
    return *this;
}

RsyncCommand& RsyncCommand::remoteShell(std::string shell) {
    remoteShell_ = std::move(shell);
    return *this;
}

RsyncCommand& RsyncCommand::wrapper(std::vector<std::string> prefix) {
    wrapper_ = std::move(prefix);
    return *this;
}

std::vector<std::string> RsyncCommand::argv() const {
    std::vector<std::string> out(wrapper_);
    out.emplace_back("rsync");
    out.emplace_back("-triv");
    out.emplace_back("--protect-args");

    if (skipEmptyDirs_) out.emplace_back("-m");
    if (skipEmptyFiles_) out.emplace_back("--min-size=1");
    if (bandwidth_.kbps) out.push_back(fmt::format("--bwlimit={}", *bandwidth_.kbps));
    if (removeSourceFiles_) out.emplace_back("--remove-source-files");

    appendConnection(out);
    if (!filesFrom_.empty()) out.push_back("--files-from=" + filesFrom_.string());

    out.push_back(source_);
    out.push_back(dest_);
    return out;
}

std::vector<std::string> RsyncCommand::deletionArgv() const {
    std::vector<std::string> out(wrapper_);
    out.emplace_back("rsync");
    out.emplace_back("-ri");
    out.emplace_back("--protect-args");
    out.emplace_back("--delete");
    out.emplace_back("--existing");
    out.emplace_back("--ignore-existing");

    appendConnection(out);

    out.push_back(source_);
    out.push_back(dest_);
    return out;
}

void RsyncCommand::appendConnection(std::vector<std::string>& out) const {
    if (source_.starts_with("rsync://") || dest_.starts_with("rsync://")) out.emplace_back("--no-motd");
    if (!passwordFile_.empty()) out.push_back("--password-file=" + passwordFile_.string());

    if (!remoteShell_.empty()) {
        out.emplace_back("-e");
        out.push_back(remoteShell_);
    }
}

namespace {

std::string ltrim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t"));
    return s;
}

}

void RsyncReport::consume(const std::string& line) {
    if (line.empty()) return;

    if (line.starts_with("*deleting")) {
        deleted_files.push_back(ltrim(line.substr(9)));
        return;
    }

    // Itemized change: YXcstpoguax followed by the path.
    if (line.size() > 3 && (line[0] == '>' || line[0] == '<') && line[1] == 'f') {
        const auto sp = line.find(' ');
        if (sp == std::string::npos) return;
        const auto path = line.substr(sp + 1);
        if (line[2] == '+') new_files.push_back(path);
        else updated_files.push_back(path);
        return;
    }

    const bool vanished = line.starts_with("file has vanished: ");
    if (!vanished && !line.starts_with("rsync: ") && !line.starts_with("rsync error: ")) return;

    last_error = line;
    if (line.starts_with("rsync error: ")) return;

    const auto q1 = line.find('"');
    if (q1 == std::string::npos) return;
    const auto q2 = line.find('"', q1 + 1);
    if (q2 == std::string::npos) return;

    std::string reason = vanished ? "file has vanished" : line.substr(q2 + 1);
    if (reason.starts_with(":")) reason = ltrim(reason.substr(1));
    failures.push_back({line.substr(q1 + 1, q2 - q1 - 1), reason});
}

CopyResult::Status ovdm::protocols::classifyRsyncExit(const process::Result& result) {
    if (result.signaled) return CopyResult::Status::Interrupted;
    switch (result.exit_code) {
        case 0: return CopyResult::Status::Success;
        case 23:
        case 24: return CopyResult::Status::Partial;
        case 20: return CopyResult::Status::Interrupted;
        default: return CopyResult::Status::Fatal;
    }
}

std::vector<FileEntry> ovdm::protocols::parseRsyncListing(const std::vector<std::string>& lines) {
    std::vector<FileEntry> entries;
    std::set<std::string> parents;

    for (const auto& line : lines) {
        std::istringstream iss(line);
        std::string perms, size, date, time;
        if (!(iss >> perms >> size >> date >> time) || perms.size() < 10) continue;
        if (perms[0] != '-' && perms[0] != 'd') continue;

        std::string name;
        std::getline(iss, name);
        name = ltrim(name);
        if (name.empty() || name == ".") continue;

        std::erase(size, ',');
        std::uintmax_t bytes = 0;
        if (std::from_chars(size.data(), size.data() + size.size(), bytes).ec != std::errc{}) continue;

        std::tm tm{};
        std::istringstream ts(date + " " + time);
        ts >> std::get_time(&tm, "%Y/%m/%d %H:%M:%S");
        if (ts.fail()) continue;

        entries.push_back({name, perms[0] == 'd' ? 0 : bytes, ::timegm(&tm), perms[0] == 'd'});

        for (auto pos = name.find('/'); pos != std::string::npos; pos = name.find('/', pos + 1))
            parents.insert(name.substr(0, pos));
    }

    std::erase_if(entries, [&](const FileEntry& e) { return e.is_dir && parents.contains(e.rel_path); });
    return entries;
}

std::string ovdm::protocols::shellQuote(const std::string& word) {
    std::string out = "'";
    for (const char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}
