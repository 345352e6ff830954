#include "util/glob.hpp"

#include <boost/algorithm/string.hpp>
#include <fnmatch.h>
#include <algorithm>

namespace ovdm::util {

std::vector<std::string> splitPatterns(const std::string_view field) {
    std::vector<std::string> parts;
    const std::string s(field);
    boost::algorithm::split(parts, s, boost::is_any_of(","));

    std::vector<std::string> out;
    for (auto& p : parts) {
        boost::algorithm::trim(p);
        if (!p.empty()) out.push_back(std::move(p));
    }
    return out;
}

bool globMatch(const std::string& pattern, const std::string& path) {
    return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
}

bool matchesAny(const std::vector<std::string>& patterns, const std::string& path) {
    return std::ranges::any_of(patterns, [&](const std::string& p) { return globMatch(p, path); });
}

std::vector<std::string> expandDoubleStar(const std::vector<std::string>& patterns) {
    std::vector<std::string> out;
    for (const auto& p : patterns) {
        if (p.starts_with("**/")) {
            out.push_back(p);
            out.push_back(p.substr(3));
        } else {
            out.push_back("**/" + p);
            out.push_back(p);
        }
    }
    return out;
}

bool isAscii(const std::string_view s) {
    return std::ranges::all_of(s, [](const char c) { return static_cast<unsigned char>(c) < 0x80; });
}

}
