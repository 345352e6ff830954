#include "filter/Engine.hpp"
#include "log/Registry.hpp"
#include "util/glob.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

using namespace ovdm::filter;
using namespace ovdm::types;
using namespace ovdm::util;
using namespace ovdm::log;

namespace fs = std::filesystem;

Engine::Engine(config::WarehouseConfig warehouse, config::FilterConfig filters)
    : warehouse_(std::move(warehouse)),
      defaultIgnore_(expandDoubleStar(filters.default_ignore)) {}

fs::path Engine::cruiseDir(const VoyageContext& voyage) const {
    if (!voyage.cruiseActive()) throw ContextUnavailable("No active cruise");
    return warehouse_.base_dir / voyage.cruise_id;
}

fs::path Engine::loweringDir(const VoyageContext& voyage) const {
    if (!voyage.loweringActive()) throw ContextUnavailable("No active lowering");
    return cruiseDir(voyage) / warehouse_.lowering_base_dir / *voyage.lowering_id;
}

void Engine::validate(const TransferDefinition& def) const {
    if (def.name.empty() || std::ranges::any_of(def.name, [](const char c) { return std::isspace(static_cast<unsigned char>(c)); }))
        throw ConfigurationError(fmt::format("Transfer {} has an invalid name '{}'", def.id, def.name));

    if (def.isPull() && def.source_dir.empty() && def.transfer_type == TransferType::LocalDirectory)
        throw ConfigurationError(fmt::format("Transfer '{}' has no source directory", def.name));

    if (!def.isPull() && def.dest_dir.empty())
        throw ConfigurationError(fmt::format("Transfer '{}' has no destination directory", def.name));

    const auto& c = def.credentials;
    switch (def.transfer_type) {
        case TransferType::LocalDirectory: break;
        case TransferType::SmbShare:
        case TransferType::NfsShare:
            if (c.share.empty()) throw ConfigurationError(fmt::format("Transfer '{}' has no share", def.name));
            [[fallthrough]];
        case TransferType::RsyncServer:
        case TransferType::SshServer:
            if (c.server.empty()) throw ConfigurationError(fmt::format("Transfer '{}' has no server", def.name));
            break;
    }

    if ((def.transfer_type == TransferType::RsyncServer || def.transfer_type == TransferType::SshServer) && c.user.empty())
        throw ConfigurationError(fmt::format("Transfer '{}' has no user", def.name));
}

std::vector<std::string> Engine::patterns(const std::string& field, const TokenContext& ctx) const {
    return splitPatterns(substitute(field, ctx, TokenMode::Pattern));
}

ResolvedTransfer Engine::resolve(const TransferDefinition& def,
                                 const VoyageContext& voyage,
                                 const ExclusionSources& exclusions,
                                 const std::time_t now) const {
    validate(def);

    const TokenContext ctx{voyage, warehouse_.lowering_base_dir, now};

    ResolvedTransfer out;
    out.definition = def;
    out.voyage = voyage;
    out.resolved_at = now;

    if (def.isPull()) {
        out.source_dir = substitute(def.source_dir, ctx, TokenMode::Path);
        const auto root = def.cruise_or_lowering == Scope::Lowering ? loweringDir(voyage) : cruiseDir(voyage);
        auto rel = substitute(def.dest_dir, ctx, TokenMode::Path);
        while (rel.starts_with('/')) rel.erase(0, 1);
        out.dest_dir = (root / rel).lexically_normal().string();
    } else {
        out.source_dir = cruiseDir(voyage).string();
        out.dest_dir = substitute(def.dest_dir, ctx, TokenMode::Path);
    }

    // trailing separators confuse rsync's source semantics
    while (out.dest_dir.size() > 1 && out.dest_dir.ends_with('/')) out.dest_dir.pop_back();
    while (out.source_dir.size() > 1 && out.source_dir.ends_with('/')) out.source_dir.pop_back();

    out.include = patterns(def.include_filter, ctx);
    out.exclude = patterns(def.exclude_filter, ctx);
    out.ignore = patterns(def.ignore_filter, ctx);
    out.ignore.insert(out.ignore.end(), defaultIgnore_.begin(), defaultIgnore_.end());

    if (!def.isPull()) addOutboundExclusions(out, exclusions, now);

    if (def.use_start_date) {
        if (def.isPull() && def.cruise_or_lowering == Scope::Lowering) {
            out.window_start = voyage.lowering_start;
            out.window_end = voyage.lowering_end;
        } else {
            out.window_start = voyage.cruise_start;
            out.window_end = voyage.cruise_end;
        }
    }

    Registry::filter()->debug("[FilterEngine] Resolved '{}': {} -> {} (include={}, exclude={}, ignore={})",
                              def.name, out.source_dir, out.dest_dir,
                              out.include.size(), out.exclude.size(), out.ignore.size());
    return out;
}

void Engine::addOutboundExclusions(ResolvedTransfer& out, const ExclusionSources& exclusions, const std::time_t now) const {
    const auto& def = out.definition;

    if (!def.include_ovdm_files) {
        for (const auto* fn : {&warehouse_.cruise_config_fn, &warehouse_.md5_summary_fn, &warehouse_.md5_summary_md5_fn})
            if (!fn->empty()) out.exclude.push_back("*" + *fn);
        for (const auto& fn : warehouse_.metadata_files) out.exclude.push_back("*" + fn);
    }

    for (const auto& cs : exclusions.collection_systems) {
        try {
            if (cs.cruise_or_lowering == Scope::Lowering) {
                for (const auto& lowering : out.voyage.lowerings) {
                    auto perLowering = out.voyage;
                    perLowering.lowering_id = lowering;
                    const TokenContext ctx{perLowering, warehouse_.lowering_base_dir, now};
                    out.exclude.push_back(fmt::format("*{}/{}/{}*", warehouse_.lowering_base_dir, lowering,
                                                      substitute(cs.dest_dir, ctx, TokenMode::Pattern)));
                }
            } else {
                const TokenContext ctx{out.voyage, warehouse_.lowering_base_dir, now};
                out.exclude.push_back("*" + substitute(cs.dest_dir, ctx, TokenMode::Pattern) + "*");
            }
        } catch (const ContextUnavailable& e) {
            Registry::filter()->warn("[FilterEngine] Skipping exclusion of '{}' for '{}': {}", cs.name, def.name, e.what());
        }
    }

    for (const auto& dir : exclusions.extra_directories) {
        const TokenContext ctx{out.voyage, warehouse_.lowering_base_dir, now};
        try {
            out.exclude.push_back("*" + substitute(dir.dest_dir, ctx, TokenMode::Pattern) + "*");
        } catch (const ContextUnavailable& e) {
            Registry::filter()->warn("[FilterEngine] Skipping exclusion of '{}' for '{}': {}", dir.name, def.name, e.what());
        }
    }
}

Plan Engine::plan(const ResolvedTransfer& transfer, std::vector<FileEntry> candidates, const std::time_t now) const {
    const auto& def = transfer.definition;
    const bool checkStaleness = def.category == Category::CollectionSystem && def.staleness > 0;

    std::ranges::sort(candidates, {}, &FileEntry::rel_path);

    Plan plan;
    for (const auto& entry : candidates) {
        const auto& path = entry.rel_path;

        if (matchesAny(transfer.ignore, path)) continue;
        if (!transfer.include.empty() && !matchesAny(transfer.include, path)) continue;
        if (matchesAny(transfer.exclude, path)) continue;

        if (!isAscii(path)) {
            plan.excluded.push_back(path);
            continue;
        }

        if (entry.is_dir) {
            if (!def.skip_empty_dirs) plan.include.push_back(entry);
            continue;
        }

        if (transfer.window_start && entry.mtime < *transfer.window_start) continue;
        if (transfer.window_end && entry.mtime > *transfer.window_end) continue;

        if (checkStaleness && now - entry.mtime < static_cast<std::time_t>(def.staleness)) {
            plan.deferred.push_back(path);
            continue;
        }

        if (def.skip_empty_files && entry.size == 0) continue;

        plan.total_bytes += entry.size;
        plan.include.push_back(entry);
    }

    Registry::filter()->debug("[FilterEngine] Plan for '{}': {} included, {} excluded, {} deferred",
                              def.name, plan.include.size(), plan.excluded.size(), plan.deferred.size());
    return plan;
}
