#pragma once

#include "process/Runner.hpp"
#include "protocols/Adapter.hpp"
#include "types/Plan.hpp"
#include "types/Report.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ovdm::protocols {

// Argument vector for one rsync invocation. Built up front so the exact flags can be inspected.
class RsyncCommand {
public:
    RsyncCommand(std::string source, std::string dest);

    RsyncCommand& bandwidth(const BandwidthLimit& limit);
    RsyncCommand& removeSourceFiles(bool on);
    RsyncCommand& skipEmptyDirs(bool on);
    RsyncCommand& skipEmptyFiles(bool on);
    RsyncCommand& deleteExtraneous(bool on);
    RsyncCommand& filesFrom(std::filesystem::path path);
    RsyncCommand& passwordFile(std::filesystem::path path);
    RsyncCommand& remoteShell(std::string shell);
    RsyncCommand& wrapper(std::vector<std::string> prefix);

    [[nodiscard]] std::vector<std::string> argv() const;

    // A --files-from copy never deletes, so mirroring runs a second pass over the whole source
    // that transfers nothing and removes destination files with no source counterpart.
    [[nodiscard]] std::vector<std::string> deletionArgv() const;
    [[nodiscard]] bool deletesExtraneous() const { return delete_; }

    [[nodiscard]] const std::string& source() const { return source_; }
    [[nodiscard]] const std::string& dest() const { return dest_; }

private:
    std::string source_, dest_;
    BandwidthLimit bandwidth_{};
    bool removeSourceFiles_{false}, skipEmptyDirs_{false}, skipEmptyFiles_{false}, delete_{false};
    std::filesystem::path filesFrom_{}, passwordFile_{};
    std::string remoteShell_{};
    std::vector<std::string> wrapper_{};

    void appendConnection(std::vector<std::string>& out) const;
};

// Accumulates the itemized (-i) output of a transfer line by line.
struct RsyncReport {
    std::vector<std::string> new_files{}, updated_files{}, deleted_files{};
    std::vector<types::FileFailure> failures{};
    std::string last_error{};

    void consume(const std::string& line);
};

// 0 ok, 23/24 partial, 20 or a signal interrupted, anything else fatal.
types::CopyResult::Status classifyRsyncExit(const process::Result& result);

// Parses `rsync --list-only -r` output into candidates; only empty directories are kept.
std::vector<types::FileEntry> parseRsyncListing(const std::vector<std::string>& lines);

// Single-quotes a word for a remote POSIX shell.
std::string shellQuote(const std::string& word);

}
