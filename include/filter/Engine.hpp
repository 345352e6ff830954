#pragma once

#include "config/Config.hpp"
#include "filter/Tokens.hpp"
#include "types/Plan.hpp"
#include "types/TransferDefinition.hpp"
#include "types/VoyageContext.hpp"
#include "util/timestamp.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ovdm::filter {

enum class Direction { Pull, Push };

// A definition with every template resolved against one voyage context.
struct ResolvedTransfer {
    types::TransferDefinition definition{};
    types::VoyageContext voyage{};

    std::string source_dir{}, dest_dir{};
    std::vector<std::string> include{}, exclude{}, ignore{};
    std::optional<std::time_t> window_start{}, window_end{};
    std::time_t resolved_at{};

    [[nodiscard]] Direction direction() const {
        return definition.isPull() ? Direction::Pull : Direction::Push;
    }
};

// Sub-trees a cruise data transfer must leave behind.
struct ExclusionSources {
    std::vector<types::TransferDefinition> collection_systems{};
    std::vector<types::ExtraDirectory> extra_directories{};
};

class Engine {
public:
    Engine(config::WarehouseConfig warehouse, config::FilterConfig filters);

    // Throws ContextUnavailable or ConfigurationError.
    [[nodiscard]] ResolvedTransfer resolve(const types::TransferDefinition& def,
                                           const types::VoyageContext& voyage,
                                           const ExclusionSources& exclusions = {},
                                           std::time_t now = util::now()) const;

    // Pure function of its inputs: identical candidates and clock give an identical plan.
    [[nodiscard]] types::Plan plan(const ResolvedTransfer& transfer,
                                   std::vector<types::FileEntry> candidates,
                                   std::time_t now = util::now()) const;

    [[nodiscard]] std::filesystem::path cruiseDir(const types::VoyageContext& voyage) const;
    [[nodiscard]] std::filesystem::path loweringDir(const types::VoyageContext& voyage) const;

    [[nodiscard]] const config::WarehouseConfig& warehouse() const { return warehouse_; }

private:
    config::WarehouseConfig warehouse_;
    std::vector<std::string> defaultIgnore_;

    void validate(const types::TransferDefinition& def) const;

    std::vector<std::string> patterns(const std::string& field, const TokenContext& ctx) const;

    void addOutboundExclusions(ResolvedTransfer& out, const ExclusionSources& exclusions, std::time_t now) const;
};

}
