#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ovdm::util {

// Splits a comma-separated filter field into trimmed, non-empty patterns.
std::vector<std::string> splitPatterns(std::string_view field);

// fnmatch without FNM_PATHNAME: '*' also crosses directory separators.
bool globMatch(const std::string& pattern, const std::string& path);

bool matchesAny(const std::vector<std::string>& patterns, const std::string& path);

// "**/x" patterns are duplicated without the prefix so top-level entries match too.
std::vector<std::string> expandDoubleStar(const std::vector<std::string>& patterns);

bool isAscii(std::string_view s);

}
