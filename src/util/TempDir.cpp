#include "util/TempDir.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

using namespace ovdm::util;

TempDir::TempDir(const std::string& prefix) {
    auto tmpl = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) throw std::system_error(errno, std::generic_category(), "mkdtemp");
    path_ = buf.data();
}

TempDir::~TempDir() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}
