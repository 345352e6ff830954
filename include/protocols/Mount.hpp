#pragma once

#include "process/Runner.hpp"
#include "util/TempDir.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ovdm::protocols {

// A network share mounted on a scratch directory for as long as this object lives.
class Mount {
public:
    explicit Mount(std::shared_ptr<process::Runner> runner);
    ~Mount();

    Mount(const Mount&) = delete;
    Mount& operator=(const Mount&) = delete;

    // Scratch space beside the mount point, e.g. for a credentials file.
    [[nodiscard]] const std::filesystem::path& scratch() const { return scratch_.path(); }
    [[nodiscard]] std::filesystem::path point() const { return scratch_.path() / "mnt"; }

    [[nodiscard]] bool mounted() const { return mounted_; }

    // Runs a prepared mount command. On failure the output is kept for the report.
    bool attach(const std::vector<std::string>& argv);

    // Records why the share could not be mounted without running anything.
    void fail(std::string reason) { error_ = std::move(reason); }

    [[nodiscard]] const std::string& error() const { return error_; }

    // Path of a share-relative directory under the mount point.
    [[nodiscard]] std::filesystem::path resolve(const std::string& dir) const;

private:
    std::shared_ptr<process::Runner> runner_;
    util::TempDir scratch_;
    bool mounted_{false};
    std::string error_;
};

}
