#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ovdm::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    std::tm tm{};
    gmtime_r(&ts, &tm);
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return timegm(&tm);
}

// Voyage dates are entered by operators as "YYYY/mm/dd HH:MM" (UTC).
inline std::optional<std::time_t> parseVoyageDate(const std::string& str) {
    if (str.empty()) return std::nullopt;
    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y/%m/%d %H:%M");
    if (ss.fail()) throw std::runtime_error("Failed to parse voyage date: " + str);
    return timegm(&tm);
}

inline std::string voyageDateToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y/%m/%d %H:%M", &tm);
    return {buffer};
}

inline std::string compactTimestamp(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

inline std::time_t fileTimeToTimeT(const std::filesystem::file_time_type tp) {
    using namespace std::chrono;
    const auto sctp = time_point_cast<system_clock::duration>(tp - decltype(tp)::clock::now() + system_clock::now());
    return system_clock::to_time_t(sctp);
}

inline std::time_t now() { return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()); }

} // namespace ovdm::util
