#include "util/files.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

std::string ovdm::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void ovdm::util::writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out << content;
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

bool ovdm::util::isMountPoint(const fs::path& path) {
    struct stat self{}, parent{};
    if (::lstat(path.c_str(), &self) != 0 || !S_ISDIR(self.st_mode)) return false;

    const auto parentPath = (path / "..").lexically_normal();
    if (::stat(parentPath.c_str(), &parent) != 0) return false;

    if (self.st_dev != parent.st_dev) return true;
    return self.st_ino == parent.st_ino;
}

std::uintmax_t ovdm::util::directorySize(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    std::uintmax_t total = 0;
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && !it->is_symlink(ec)) total += it->file_size(ec);
    }
    return total;
}

std::vector<std::string> ovdm::util::removeUnlisted(const fs::path& root, const std::set<std::string>& keep) {
    std::vector<std::string> removed;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return removed;

    std::vector<fs::path> doomed;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const auto rel = fs::relative(it->path(), root, ec).generic_string();
        if (!keep.contains(rel)) doomed.push_back(it->path());
    }

    for (const auto& p : doomed) {
        if (fs::remove(p, ec)) removed.push_back(fs::relative(p, root).generic_string());
    }
    return removed;
}

void ovdm::util::pruneEmptyDirectories(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return;

    std::vector<fs::path> dirs;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec))
        if (it->is_directory(ec) && !it->is_symlink(ec)) dirs.push_back(it->path());

    // deepest first so parents empty out after their children
    std::ranges::sort(dirs, [](const fs::path& a, const fs::path& b) { return a.string().size() > b.string().size(); });
    for (const auto& d : dirs)
        if (fs::is_empty(d, ec)) fs::remove(d, ec);
}

size_t ovdm::util::passwdBufferSize() {
    const long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    return size > 0 ? static_cast<size_t>(size) : 16384;
}

std::string ovdm::util::setOwner(const std::string& user, const fs::path& root) {
    passwd entry{};
    passwd* pw = nullptr;
    std::vector<char> buf(passwdBufferSize());
    if (::getpwnam_r(user.c_str(), &entry, buf.data(), buf.size(), &pw) != 0 || !pw) return "Unknown user: " + user;

    auto chownOne = [&](const fs::path& p) -> std::string {
        if (::lchown(p.c_str(), pw->pw_uid, pw->pw_gid) != 0)
            return "Unable to set ownership of " + p.string() + ": " + std::error_code(errno, std::generic_category()).message();
        return "";
    };

    if (auto err = chownOne(root); !err.empty()) return err;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) return "";

    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec))
        if (auto err = chownOne(it->path()); !err.empty()) return err;

    return ec ? ec.message() : "";
}

bool ovdm::util::canWrite(const fs::path& dir) {
    const auto probe = dir / ".ovdm_write_test";
    {
        std::ofstream out(probe);
        if (!out) return false;
        out << "write test\n";
        if (!out) return false;
    }
    std::error_code ec;
    fs::remove(probe, ec);
    return !ec;
}
