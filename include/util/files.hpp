#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace ovdm::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::string& content);

// A path is a mount point when it sits on a different device than its parent, or is "/".
bool isMountPoint(const std::filesystem::path& path);

std::uintmax_t directorySize(const std::filesystem::path& dir);

// Deletes regular files under root whose root-relative path is not in keep. Returns what was removed.
std::vector<std::string> removeUnlisted(const std::filesystem::path& root, const std::set<std::string>& keep);

// Removes empty directories below root (root itself is kept).
void pruneEmptyDirectories(const std::filesystem::path& root);

// chown -R user:user. Returns an error string, empty on success.
std::string setOwner(const std::string& user, const std::filesystem::path& root);

// Scratch size for the reentrant getpw*_r/getgr*_r lookups.
size_t passwdBufferSize();

// Probes write permission by creating and deleting a scratch file.
bool canWrite(const std::filesystem::path& dir);

}
