#include "filter/Tokens.hpp"

#include <fmt/format.h>
#include <unordered_map>

using namespace ovdm::filter;

namespace {

struct DateToken {
    const char* strftime;
    const char* glob;
};

const std::unordered_map<std::string, DateToken>& dateTokens() {
    static const std::unordered_map<std::string, DateToken> tokens = {
        {"YYYY", {"%Y", "20[0-9][0-9]"}},
        {"YY", {"%y", "[0-9][0-9]"}},
        {"mm", {"%m", "[0-1][0-9]"}},
        {"DD", {"%d", "[0-3][0-9]"}},
        {"HH", {"%H", "[0-2][0-9]"}},
        {"MM", {"%M", "[0-5][0-9]"}},
        {"SS", {"%S", "[0-5][0-9]"}},
    };
    return tokens;
}

std::string formatNow(const char* fmtStr, const std::time_t now) {
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[16];
    const auto n = std::strftime(buf, sizeof(buf), fmtStr, &tm);
    return {buf, n};
}

std::string expand(const std::string& token, const std::string& tmpl, const TokenContext& ctx, const TokenMode mode) {
    if (token == "cruiseID") {
        if (!ctx.voyage.cruiseActive()) throw ContextUnavailable(fmt::format("'{}' needs an active cruise", tmpl));
        return ctx.voyage.cruise_id;
    }

    if (token == "loweringID") {
        if (!ctx.voyage.loweringActive()) throw ContextUnavailable(fmt::format("'{}' needs an active lowering", tmpl));
        return *ctx.voyage.lowering_id;
    }

    if (token == "loweringDataBaseDir") {
        if (ctx.lowering_base_dir.empty())
            throw ConfigurationError(fmt::format("'{}' uses {{loweringDataBaseDir}} but none is configured", tmpl));
        return ctx.lowering_base_dir;
    }

    const auto& dates = dateTokens();
    if (const auto it = dates.find(token); it != dates.end())
        return mode == TokenMode::Path ? formatNow(it->second.strftime, ctx.now) : it->second.glob;

    throw ConfigurationError(fmt::format("Unknown token '{{{}}}' in '{}'", token, tmpl));
}

}

std::string ovdm::filter::substitute(const std::string& tmpl, const TokenContext& ctx, const TokenMode mode) {
    std::string out;
    out.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        const auto open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos);
            break;
        }

        const auto close = tmpl.find('}', open);
        if (close == std::string::npos) throw ConfigurationError(fmt::format("Unterminated token in '{}'", tmpl));

        out.append(tmpl, pos, open - pos);
        out += expand(tmpl.substr(open + 1, close - open - 1), tmpl, ctx, mode);
        pos = close + 1;
    }

    return out;
}
