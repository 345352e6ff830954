#include "types/VoyageContext.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace ovdm::types;
using namespace ovdm::util;

namespace {

nlohmann::json optionalDate(const std::optional<std::time_t>& t) {
    return t ? nlohmann::json(voyageDateToString(*t)) : nlohmann::json("");
}

}

void ovdm::types::to_json(nlohmann::json& j, const VoyageContext& v) {
    j = {
        {"cruiseID", v.cruise_id},
        {"loweringID", v.lowering_id.value_or("")},
        {"cruiseStartDate", optionalDate(v.cruise_start)},
        {"cruiseEndDate", optionalDate(v.cruise_end)},
        {"loweringStartDate", optionalDate(v.lowering_start)},
        {"loweringEndDate", optionalDate(v.lowering_end)},
        {"systemStatus", v.system_on ? "On" : "Off"}
    };
}

void ovdm::types::from_json(const nlohmann::json& j, VoyageContext& v) {
    v.cruise_id = j.value("cruiseID", "");
    const auto lowering = j.value("loweringID", "");
    if (!lowering.empty()) v.lowering_id = lowering;
    v.cruise_start = parseVoyageDate(j.value("cruiseStartDate", ""));
    v.cruise_end = parseVoyageDate(j.value("cruiseEndDate", ""));
    v.lowering_start = parseVoyageDate(j.value("loweringStartDate", ""));
    v.lowering_end = parseVoyageDate(j.value("loweringEndDate", ""));
    v.system_on = j.value("systemStatus", "Off") == "On";
}

void ovdm::types::to_json(nlohmann::json& j, const SizeSnapshot& s) {
    j = {
        {"cruiseSize", s.cruise_bytes ? nlohmann::json(*s.cruise_bytes) : nlohmann::json(nullptr)},
        {"loweringSize", s.lowering_bytes ? nlohmann::json(*s.lowering_bytes) : nlohmann::json(nullptr)},
        {"updatedAt", s.updated_at ? timestampToString(s.updated_at) : ""}
    };
}
