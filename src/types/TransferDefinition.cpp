#include "types/TransferDefinition.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <pqxx/field>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ovdm::types;

namespace {

std::vector<unsigned int> parseIdList(const pqxx::field& f) {
    if (f.is_null()) return {};
    const auto j = nlohmann::json::parse(f.as<std::string>(), nullptr, false);
    if (!j.is_array()) return {};
    return j.get<std::vector<unsigned int>>();
}

}

TransferDefinition::TransferDefinition(const pqxx::row& row)
    : id(row.at("id").as<unsigned int>()),
      name(row.at("name").as<std::string>()),
      long_name(row.at("long_name").as<std::string>("")),
      category(categoryFromString(row.at("category").as<std::string>())),
      cruise_or_lowering(scopeFromString(row.at("cruise_or_lowering").as<std::string>("cruise"))),
      transfer_type(transferTypeFromString(row.at("transfer_type").as<std::string>())),
      source_dir(row.at("source_dir").as<std::string>("")),
      dest_dir(row.at("dest_dir").as<std::string>("")),
      include_filter(row.at("include_filter").as<std::string>("")),
      exclude_filter(row.at("exclude_filter").as<std::string>("")),
      ignore_filter(row.at("ignore_filter").as<std::string>("")),
      staleness(row.at("staleness").as<unsigned int>(0)),
      remove_source_files(row.at("remove_source_files").as<bool>(false)),
      skip_empty_dirs(row.at("skip_empty_dirs").as<bool>(true)),
      skip_empty_files(row.at("skip_empty_files").as<bool>(true)),
      sync_to_dest(row.at("sync_to_dest").as<bool>(false)),
      sync_from_source(row.at("sync_from_source").as<bool>(false)),
      use_start_date(row.at("use_start_date").as<bool>(false)),
      local_dir_is_mount_point(row.at("local_dir_is_mount_point").as<bool>(false)),
      include_ovdm_files(row.at("include_ovdm_files").as<bool>(false)),
      bandwidth_limit(row.at("bandwidth_limit").as<unsigned int>(0)),
      excluded_collection_systems(parseIdList(row.at("excluded_collection_systems"))),
      excluded_extra_directories(parseIdList(row.at("excluded_extra_directories"))),
      enable(row.at("enable").as<bool>(false)) {
    credentials.server = row.at("server").as<std::string>("");
    credentials.user = row.at("username").as<std::string>("");
    credentials.password = row.at("password").as<std::string>("");
    credentials.domain = row.at("domain").as<std::string>("");
    credentials.share = row.at("share").as<std::string>("");
    credentials.use_ssh_key = row.at("use_ssh_key").as<bool>(false);
    credentials.mount_required = row.at("mount_required").as<bool>(false);

    live.status = statusFromString(row.at("status").as<std::string>("idle"));
    if (!row.at("pid").is_null()) live.pid = row.at("pid").as<int>();
    if (!row.at("last_result").is_null()) {
        const auto j = nlohmann::json::parse(row.at("last_result").as<std::string>(), nullptr, false);
        if (j.is_object()) from_json(j, live.last_result);
    }
}

void ovdm::types::to_json(nlohmann::json& j, const Credentials& c) {
    j = {
        {"server", c.server},
        {"user", c.user},
        {"domain", c.domain},
        {"share", c.share},
        {"use_ssh_key", c.use_ssh_key},
        {"mount_required", c.mount_required}
    };
}

void ovdm::types::from_json(const nlohmann::json& j, Credentials& c) {
    c.server = j.value("server", "");
    c.user = j.value("user", "");
    c.password = j.value("password", "");
    c.domain = j.value("domain", "");
    c.share = j.value("share", "");
    c.use_ssh_key = j.value("use_ssh_key", false);
    c.mount_required = j.value("mount_required", false);
}

void ovdm::types::to_json(nlohmann::json& j, const LastResult& r) {
    j = {
        {"outcome", to_string(r.outcome)},
        {"reason", r.reason},
        {"warnings", r.warnings},
        {"at", r.at ? util::timestampToString(r.at) : ""}
    };
}

void ovdm::types::from_json(const nlohmann::json& j, LastResult& r) {
    r.outcome = outcomeFromString(j.value("outcome", "none"));
    r.reason = j.value("reason", "");
    r.warnings = j.value("warnings", std::vector<std::string>{});
    const auto at = j.value("at", "");
    r.at = at.empty() ? 0 : util::parseTimestampFromString(at);
}

void ovdm::types::to_json(nlohmann::json& j, const LiveState& s) {
    j = {
        {"status", to_string(s.status)},
        {"pid", s.pid ? nlohmann::json(*s.pid) : nlohmann::json("")},
        {"last_result", s.last_result}
    };
}

// Passwords are never serialized outward; post-hook commands and the control socket only see endpoints.
void ovdm::types::to_json(nlohmann::json& j, const TransferDefinition& d) {
    j = {
        {"id", d.id},
        {"name", d.name},
        {"long_name", d.long_name},
        {"category", to_string(d.category)},
        {"cruise_or_lowering", to_string(d.cruise_or_lowering)},
        {"transfer_type", to_string(d.transfer_type)},
        {"credentials", d.credentials},
        {"source_dir", d.source_dir},
        {"dest_dir", d.dest_dir},
        {"include_filter", d.include_filter},
        {"exclude_filter", d.exclude_filter},
        {"ignore_filter", d.ignore_filter},
        {"staleness", d.staleness},
        {"remove_source_files", d.remove_source_files},
        {"skip_empty_dirs", d.skip_empty_dirs},
        {"skip_empty_files", d.skip_empty_files},
        {"sync_to_dest", d.sync_to_dest},
        {"sync_from_source", d.sync_from_source},
        {"use_start_date", d.use_start_date},
        {"local_dir_is_mount_point", d.local_dir_is_mount_point},
        {"include_ovdm_files", d.include_ovdm_files},
        {"bandwidth_limit", d.bandwidth_limit},
        {"excluded_collection_systems", d.excluded_collection_systems},
        {"excluded_extra_directories", d.excluded_extra_directories},
        {"enable", d.enable},
        {"live", d.live}
    };
}

void ovdm::types::from_json(const nlohmann::json& j, TransferDefinition& d) {
    d.id = j.at("id").get<unsigned int>();
    d.name = j.at("name").get<std::string>();
    d.long_name = j.value("long_name", "");
    d.category = categoryFromString(j.at("category").get<std::string>());
    d.cruise_or_lowering = scopeFromString(j.value("cruise_or_lowering", "cruise"));
    d.transfer_type = transferTypeFromString(j.at("transfer_type").get<std::string>());
    if (j.contains("credentials")) j.at("credentials").get_to(d.credentials);
    d.source_dir = j.value("source_dir", "");
    d.dest_dir = j.value("dest_dir", "");
    d.include_filter = j.value("include_filter", "");
    d.exclude_filter = j.value("exclude_filter", "");
    d.ignore_filter = j.value("ignore_filter", "");
    d.staleness = j.value("staleness", 0u);
    d.remove_source_files = j.value("remove_source_files", false);
    d.skip_empty_dirs = j.value("skip_empty_dirs", true);
    d.skip_empty_files = j.value("skip_empty_files", true);
    d.sync_to_dest = j.value("sync_to_dest", false);
    d.sync_from_source = j.value("sync_from_source", false);
    d.use_start_date = j.value("use_start_date", false);
    d.local_dir_is_mount_point = j.value("local_dir_is_mount_point", false);
    d.include_ovdm_files = j.value("include_ovdm_files", false);
    d.bandwidth_limit = j.value("bandwidth_limit", 0u);
    d.excluded_collection_systems = j.value("excluded_collection_systems", std::vector<unsigned int>{});
    d.excluded_extra_directories = j.value("excluded_extra_directories", std::vector<unsigned int>{});
    d.enable = j.value("enable", false);
}

std::string ovdm::types::to_string(const Category c) {
    switch (c) {
        case Category::CollectionSystem: return "collection_system";
        case Category::CruiseData: return "cruise_data";
        case Category::ShipToShore: return "ship_to_shore";
        default: throw std::invalid_argument("Unknown transfer category");
    }
}

std::string ovdm::types::to_string(const Scope s) {
    switch (s) {
        case Scope::Cruise: return "cruise";
        case Scope::Lowering: return "lowering";
        default: throw std::invalid_argument("Unknown transfer scope");
    }
}

std::string ovdm::types::to_string(const TransferType t) {
    switch (t) {
        case TransferType::LocalDirectory: return "local";
        case TransferType::RsyncServer: return "rsync";
        case TransferType::SmbShare: return "smb";
        case TransferType::SshServer: return "ssh";
        case TransferType::NfsShare: return "nfs";
        default: throw std::invalid_argument("Unknown transfer type");
    }
}

std::string ovdm::types::to_string(const Status s) {
    switch (s) {
        case Status::Idle: return "idle";
        case Status::Running: return "running";
        case Status::Queued: return "queued";
        case Status::Error: return "error";
        case Status::Stopping: return "stopping";
        case Status::Starting: return "starting";
        default: throw std::invalid_argument("Unknown transfer status");
    }
}

std::string ovdm::types::to_string(const LastResult::Outcome o) {
    switch (o) {
        case LastResult::Outcome::None: return "none";
        case LastResult::Outcome::Success: return "success";
        case LastResult::Outcome::SuccessWithWarnings: return "success_with_warnings";
        case LastResult::Outcome::Failure: return "failure";
        case LastResult::Outcome::Cancelled: return "cancelled";
        case LastResult::Outcome::TestPassed: return "test_passed";
        case LastResult::Outcome::TestFailed: return "test_failed";
        case LastResult::Outcome::Skipped: return "skipped";
        default: throw std::invalid_argument("Unknown outcome");
    }
}

Category ovdm::types::categoryFromString(const std::string& str) {
    if (str == "collection_system") return Category::CollectionSystem;
    if (str == "cruise_data") return Category::CruiseData;
    if (str == "ship_to_shore") return Category::ShipToShore;
    throw std::invalid_argument("Unknown transfer category: " + str);
}

Scope ovdm::types::scopeFromString(const std::string& str) {
    if (str == "cruise") return Scope::Cruise;
    if (str == "lowering") return Scope::Lowering;
    throw std::invalid_argument("Unknown transfer scope: " + str);
}

TransferType ovdm::types::transferTypeFromString(const std::string& str) {
    if (str == "local") return TransferType::LocalDirectory;
    if (str == "rsync") return TransferType::RsyncServer;
    if (str == "smb") return TransferType::SmbShare;
    if (str == "ssh") return TransferType::SshServer;
    if (str == "nfs") return TransferType::NfsShare;
    throw std::invalid_argument("Unknown transfer type: " + str);
}

Status ovdm::types::statusFromString(const std::string& str) {
    if (str == "idle") return Status::Idle;
    if (str == "running") return Status::Running;
    if (str == "queued") return Status::Queued;
    if (str == "error") return Status::Error;
    if (str == "stopping") return Status::Stopping;
    if (str == "starting") return Status::Starting;
    throw std::invalid_argument("Unknown transfer status: " + str);
}

LastResult::Outcome ovdm::types::outcomeFromString(const std::string& str) {
    if (str == "none") return LastResult::Outcome::None;
    if (str == "success") return LastResult::Outcome::Success;
    if (str == "success_with_warnings") return LastResult::Outcome::SuccessWithWarnings;
    if (str == "failure") return LastResult::Outcome::Failure;
    if (str == "cancelled") return LastResult::Outcome::Cancelled;
    if (str == "test_passed") return LastResult::Outcome::TestPassed;
    if (str == "test_failed") return LastResult::Outcome::TestFailed;
    if (str == "skipped") return LastResult::Outcome::Skipped;
    throw std::invalid_argument("Unknown outcome: " + str);
}
