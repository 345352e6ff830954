#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ovdm::config {

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "openvdm";
    std::string user = "openvdm";
    std::string password{};
    int pool_size = 4;
};

struct WarehouseConfig {
    std::filesystem::path base_dir = "/data/CruiseData";
    std::string lowering_base_dir = "Vehicle";
    std::string transfer_logs_dir = "OpenVDM/TransferLogs";
    std::string username{};
    std::string cruise_config_fn = "ovdmConfig.json";
    std::string md5_summary_fn = "MD5_Summary.txt";
    std::string md5_summary_md5_fn = "MD5_Summary.md5";
    std::vector<std::string> metadata_files{};
};

struct SchedulerConfig {
    unsigned int transfer_interval_minutes = 5;
    unsigned int startup_delay_seconds = 10;
    bool retry_errored = true;
    bool include_outbound = true;
};

struct SizeCacherConfig {
    bool enabled = true;
    unsigned int interval_seconds = 10;
};

struct FilterConfig {
    std::vector<std::string> default_ignore = {
        "@eaDir*", ".DS_Store", "._*", "Thumbs.db", "desktop.ini", ".*.??????"
    };
};

struct PostHookCommand {
    std::string name{};
    std::vector<std::string> command{};
};

struct PostHookEntry {
    std::string transfer_name{};
    std::vector<PostHookCommand> commands{};
};

struct CtlConfig {
    bool enabled = true;
    std::string socket_path = "/run/openvdm/ctl.sock";
    std::string admin_group = "openvdm";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ovdm      = spdlog::level::info;
    spdlog::level::level_enum sched     = spdlog::level::info;
    spdlog::level::level_enum queue     = spdlog::level::info;
    spdlog::level::level_enum transfer  = spdlog::level::info;
    spdlog::level::level_enum filter    = spdlog::level::warn;
    spdlog::level::level_enum state     = spdlog::level::info;
    spdlog::level::level_enum hooks     = spdlog::level::info;
    spdlog::level::level_enum cancel    = spdlog::level::info;
    spdlog::level::level_enum proc      = spdlog::level::warn;
    spdlog::level::level_enum db        = spdlog::level::err;
    spdlog::level::level_enum ctl       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/openvdm";
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    WarehouseConfig warehouse;
    SchedulerConfig scheduler;
    SizeCacherConfig size_cacher;
    FilterConfig filters;
    CtlConfig ctl;
    LoggingConfig logging;

    // Keyed by task kind name; validated when the engine boots.
    std::map<std::string, unsigned int> workers{};
    std::map<std::string, std::vector<std::string>> hooks = defaultHooks();
    std::map<std::string, std::vector<PostHookEntry>> post_hook_commands{};
    std::map<std::string, std::vector<std::string>> task_commands{};

    static std::map<std::string, std::vector<std::string>> defaultHooks();
};

Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const WarehouseConfig& c);
void to_json(nlohmann::json& j, const SchedulerConfig& c);
void to_json(nlohmann::json& j, const SizeCacherConfig& c);
void to_json(nlohmann::json& j, const FilterConfig& c);
void to_json(nlohmann::json& j, const PostHookCommand& c);
void to_json(nlohmann::json& j, const PostHookEntry& c);
void to_json(nlohmann::json& j, const CtlConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

}
