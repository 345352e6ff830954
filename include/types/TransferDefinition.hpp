#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace ovdm::types {

enum class Category { CollectionSystem, CruiseData, ShipToShore };
enum class Scope { Cruise, Lowering };
enum class TransferType { LocalDirectory, RsyncServer, SmbShare, SshServer, NfsShare };
enum class Status { Idle, Running, Queued, Error, Stopping, Starting };

struct Credentials {
    std::string server{}, user{}, password{}, domain{}, share{};
    bool use_ssh_key{false};
    bool mount_required{false};
};

// Outcome of the most recent Test or Run, kept beside the live status.
struct LastResult {
    enum class Outcome { None, Success, SuccessWithWarnings, Failure, Cancelled, TestPassed, TestFailed, Skipped };

    Outcome outcome{Outcome::None};
    std::string reason{};
    std::vector<std::string> warnings{};
    std::time_t at{};
};

struct LiveState {
    Status status{Status::Idle};
    std::optional<int> pid{};
    LastResult last_result{};
};

struct TransferDefinition {
    unsigned int id{};
    std::string name{}, long_name{};

    Category category{Category::CollectionSystem};
    Scope cruise_or_lowering{Scope::Cruise};

    TransferType transfer_type{TransferType::LocalDirectory};
    Credentials credentials{};

    std::string source_dir{}, dest_dir{};
    std::string include_filter{}, exclude_filter{}, ignore_filter{};
    unsigned int staleness{0};

    bool remove_source_files{false};
    bool skip_empty_dirs{true};
    bool skip_empty_files{true};
    bool sync_to_dest{false};
    bool sync_from_source{false};
    bool use_start_date{false};
    bool local_dir_is_mount_point{false};
    bool include_ovdm_files{false};
    unsigned int bandwidth_limit{0};

    std::vector<unsigned int> excluded_collection_systems{};
    std::vector<unsigned int> excluded_extra_directories{};

    bool enable{false};
    LiveState live{};

    TransferDefinition() = default;
    explicit TransferDefinition(const pqxx::row& row);

    // Pull definitions copy a remote source into the warehouse; the rest push the cruise tree outward.
    [[nodiscard]] bool isPull() const { return category == Category::CollectionSystem; }
};

// Extra directories are warehouse sub-trees managed outside transfer definitions.
struct ExtraDirectory {
    unsigned int id{};
    std::string name{}, dest_dir{};
};

void to_json(nlohmann::json& j, const Credentials& c);
void from_json(const nlohmann::json& j, Credentials& c);
void to_json(nlohmann::json& j, const LastResult& r);
void from_json(const nlohmann::json& j, LastResult& r);
void to_json(nlohmann::json& j, const LiveState& s);
void to_json(nlohmann::json& j, const TransferDefinition& d);
void from_json(const nlohmann::json& j, TransferDefinition& d);

std::string to_string(Category c);
std::string to_string(Scope s);
std::string to_string(TransferType t);
std::string to_string(Status s);
std::string to_string(LastResult::Outcome o);

Category categoryFromString(const std::string& str);
Scope scopeFromString(const std::string& str);
TransferType transferTypeFromString(const std::string& str);
Status statusFromString(const std::string& str);
LastResult::Outcome outcomeFromString(const std::string& str);

}
