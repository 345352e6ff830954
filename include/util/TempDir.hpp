#pragma once

#include <filesystem>
#include <string>

namespace ovdm::util {

// mkdtemp-backed scratch directory, removed recursively on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "ovdm");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Leaves the directory on disk, e.g. when something is still mounted on it.
    void release() { path_.clear(); }

private:
    std::filesystem::path path_;
};

}
