#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ovdm::config {

namespace {

template <typename T> T getOrDefault(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

Config fromNode(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::invalid_argument("Configuration root must be a mapping");

    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["warehouse"]) YAML::convert<WarehouseConfig>::decode(node, cfg.warehouse);
    if (auto node = root["scheduler"]) YAML::convert<SchedulerConfig>::decode(node, cfg.scheduler);
    if (auto node = root["size_cacher"]) YAML::convert<SizeCacherConfig>::decode(node, cfg.size_cacher);
    if (auto node = root["filters"]) YAML::convert<FilterConfig>::decode(node, cfg.filters);
    if (auto node = root["ctl"]) YAML::convert<CtlConfig>::decode(node, cfg.ctl);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    cfg.workers = getOrDefault(root, "workers", cfg.workers);
    cfg.hooks = getOrDefault(root, "hooks", cfg.hooks);
    cfg.post_hook_commands = getOrDefault(root, "post_hook_commands", cfg.post_hook_commands);
    cfg.task_commands = getOrDefault(root, "task_commands", cfg.task_commands);

    return cfg;
}

}

std::map<std::string, std::vector<std::string>> Config::defaultHooks() {
    return {
        {"runCollectionSystemTransfer", {"updateDataDashboard", "updateMD5Summary", "postCollectionSystemTransfer"}},
        {"updateDataDashboard", {"updateMD5Summary", "postDataDashboard"}}
    };
}

Config loadConfig(const std::string& path) {
    return fromNode(YAML::LoadFile(path));
}

Config parseConfig(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"database", c.database},
        {"warehouse", c.warehouse},
        {"scheduler", c.scheduler},
        {"size_cacher", c.size_cacher},
        {"filters", c.filters},
        {"ctl", c.ctl},
        {"logging", c.logging},
        {"workers", c.workers},
        {"hooks", c.hooks},
        {"post_hook_commands", c.post_hook_commands},
        {"task_commands", c.task_commands}
    };
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"pool_size", c.pool_size}
    };
}

void to_json(nlohmann::json& j, const WarehouseConfig& c) {
    j = {
        {"base_dir", c.base_dir.string()},
        {"lowering_base_dir", c.lowering_base_dir},
        {"transfer_logs_dir", c.transfer_logs_dir},
        {"username", c.username},
        {"cruise_config_fn", c.cruise_config_fn},
        {"md5_summary_fn", c.md5_summary_fn},
        {"md5_summary_md5_fn", c.md5_summary_md5_fn},
        {"metadata_files", c.metadata_files}
    };
}

void to_json(nlohmann::json& j, const SchedulerConfig& c) {
    j = {
        {"transfer_interval_minutes", c.transfer_interval_minutes},
        {"startup_delay_seconds", c.startup_delay_seconds},
        {"retry_errored", c.retry_errored},
        {"include_outbound", c.include_outbound}
    };
}

void to_json(nlohmann::json& j, const SizeCacherConfig& c) {
    j = {{"enabled", c.enabled}, {"interval_seconds", c.interval_seconds}};
}

void to_json(nlohmann::json& j, const FilterConfig& c) {
    j = {{"default_ignore", c.default_ignore}};
}

void to_json(nlohmann::json& j, const PostHookCommand& c) {
    j = {{"name", c.name}, {"command", c.command}};
}

void to_json(nlohmann::json& j, const PostHookEntry& c) {
    j = {{"transfer_name", c.transfer_name}, {"commands", c.commands}};
}

void to_json(nlohmann::json& j, const CtlConfig& c) {
    j = {{"enabled", c.enabled}, {"socket_path", c.socket_path}, {"admin_group", c.admin_group}};
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", spdlog::level::to_string_view(c.levels.console_log_level).data()},
        {"file_log_level", spdlog::level::to_string_view(c.levels.file_log_level).data()}
    };
}

}
