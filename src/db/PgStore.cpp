#include "db/PgStore.hpp"
#include "db/Transactions.hpp"
#include "util/timestamp.hpp"

#include <map>
#include <nlohmann/json.hpp>

using namespace ovdm::db;
using namespace ovdm::types;
using namespace ovdm::util;

std::optional<TransferDefinition> PgStore::definition(const unsigned int id) {
    return Transactions::exec("PgStore::definition", [&](pqxx::work& txn) -> std::optional<TransferDefinition> {
        const auto res = txn.exec(pqxx::prepped{"get_transfer_definition"}, pqxx::params{id});
        if (res.empty()) return std::nullopt;
        return TransferDefinition(res.one_row());
    });
}

std::vector<TransferDefinition> PgStore::definitions() {
    return Transactions::exec("PgStore::definitions", [&](pqxx::work& txn) {
        std::vector<TransferDefinition> out;
        const auto res = txn.exec(pqxx::prepped{"list_transfer_definitions"});
        out.reserve(res.size());
        for (const auto& row : res) out.emplace_back(row);
        return out;
    });
}

std::optional<ExtraDirectory> PgStore::extraDirectory(const unsigned int id) {
    return Transactions::exec("PgStore::extraDirectory", [&](pqxx::work& txn) -> std::optional<ExtraDirectory> {
        const auto res = txn.exec(pqxx::prepped{"get_extra_directory"}, pqxx::params{id});
        if (res.empty()) return std::nullopt;
        const auto row = res.one_row();
        return ExtraDirectory{
            row.at("id").as<unsigned int>(),
            row.at("name").as<std::string>(),
            row.at("dest_dir").as<std::string>()
        };
    });
}

VoyageContext PgStore::voyageContext() {
    return Transactions::exec("PgStore::voyageContext", [&](pqxx::work& txn) {
        std::map<std::string, std::string> vars;
        for (const auto& row : txn.exec(pqxx::prepped{"list_core_vars"}))
            vars[row.at("name").as<std::string>()] = row.at("value").as<std::string>("");

        const auto var = [&](const std::string& name) {
            const auto it = vars.find(name);
            return it == vars.end() ? std::string{} : it->second;
        };

        VoyageContext v;
        v.cruise_id = var("cruiseID");
        if (const auto lowering = var("loweringID"); !lowering.empty()) v.lowering_id = lowering;
        v.cruise_start = parseVoyageDate(var("cruiseStartDate"));
        v.cruise_end = parseVoyageDate(var("cruiseEndDate"));
        v.lowering_start = parseVoyageDate(var("loweringStartDate"));
        v.lowering_end = parseVoyageDate(var("loweringEndDate"));
        v.system_on = var("systemStatus") == "On";

        if (v.cruiseActive())
            for (const auto& row : txn.exec(pqxx::prepped{"list_lowerings_by_cruise"}, pqxx::params{v.cruise_id}))
                v.lowerings.push_back(row.at("lowering_id").as<std::string>());

        return v;
    });
}

void PgStore::saveLiveState(const unsigned int id, const LiveState& state) {
    Transactions::exec("PgStore::saveLiveState", [&](pqxx::work& txn) {
        const nlohmann::json lastResult = state.last_result;
        pqxx::params p{id, to_string(state.status), state.pid, lastResult.dump()};
        txn.exec(pqxx::prepped{"update_transfer_live_state"}, p);
    });
}

void PgStore::saveSizes(const SizeSnapshot& sizes) {
    Transactions::exec("PgStore::saveSizes", [&](pqxx::work& txn) {
        const auto stamp = timestampToString(sizes.updated_at);
        const auto upsert = [&](const std::string& name, const std::string& value) {
            txn.exec(pqxx::prepped{"upsert_core_var"}, pqxx::params{name, value});
        };

        if (sizes.cruise_bytes) {
            upsert("cruiseSize", std::to_string(*sizes.cruise_bytes));
            upsert("cruiseSizeUpdated", stamp);
        }
        if (sizes.lowering_bytes) {
            upsert("loweringSize", std::to_string(*sizes.lowering_bytes));
            upsert("loweringSizeUpdated", stamp);
        }
    });
}
