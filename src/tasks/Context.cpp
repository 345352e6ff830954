#include "tasks/Context.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ovdm::tasks;
using namespace ovdm::types;
using namespace ovdm::log;

ovdm::filter::ExclusionSources ovdm::tasks::exclusionsFor(const TransferDefinition& def, state::RecordStore& store) {
    filter::ExclusionSources out;
    if (def.isPull()) return out;

    if (!def.excluded_collection_systems.empty()) {
        for (auto& other : store.definitions()) {
            if (other.category != Category::CollectionSystem) continue;
            if (std::ranges::find(def.excluded_collection_systems, other.id) == def.excluded_collection_systems.end()) continue;
            out.collection_systems.push_back(std::move(other));
        }
    }

    for (const auto id : def.excluded_extra_directories) {
        if (auto dir = store.extraDirectory(id)) out.extra_directories.push_back(std::move(*dir));
        else Registry::filter()->warn("[Exclusions] {} excludes unknown extra directory {}", def.name, id);
    }

    return out;
}

ovdm::filter::ResolvedTransfer ovdm::tasks::resolve(const Context& ctx, const TransferDefinition& def,
                                                    const VoyageContext& voyage, const std::time_t now) {
    return ctx.filter->resolve(def, voyage, exclusionsFor(def, *ctx.store), now);
}
