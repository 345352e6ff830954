#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ovdm::types {

struct VoyageContext {
    std::string cruise_id{};
    std::optional<std::string> lowering_id{};
    std::optional<std::time_t> cruise_start{}, cruise_end{};
    std::optional<std::time_t> lowering_start{}, lowering_end{};
    bool system_on{false};

    // Every lowering recorded for the active cruise; used to expand lowering-scoped exclusions.
    std::vector<std::string> lowerings{};

    [[nodiscard]] bool loweringActive() const { return lowering_id.has_value() && !lowering_id->empty(); }
    [[nodiscard]] bool cruiseActive() const { return !cruise_id.empty(); }
};

struct SizeSnapshot {
    std::optional<std::uintmax_t> cruise_bytes{}, lowering_bytes{};
    std::time_t updated_at{};
};

void to_json(nlohmann::json& j, const VoyageContext& v);
void from_json(const nlohmann::json& j, VoyageContext& v);
void to_json(nlohmann::json& j, const SizeSnapshot& s);

}
