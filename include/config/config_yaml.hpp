#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ovdm::config;

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("openvdm");
        rhs.user = node["user"].as<std::string>("openvdm");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<int>(4);
        return true;
    }
};

template<>
struct convert<WarehouseConfig> {
    static Node encode(const WarehouseConfig& rhs) {
        Node node;
        node["base_dir"] = rhs.base_dir;
        node["lowering_base_dir"] = rhs.lowering_base_dir;
        node["transfer_logs_dir"] = rhs.transfer_logs_dir;
        node["username"] = rhs.username;
        node["cruise_config_fn"] = rhs.cruise_config_fn;
        node["md5_summary_fn"] = rhs.md5_summary_fn;
        node["md5_summary_md5_fn"] = rhs.md5_summary_md5_fn;
        node["metadata_files"] = rhs.metadata_files;
        return node;
    }

    static bool decode(const Node& node, WarehouseConfig& rhs) {
        if (!node.IsMap()) return false;
        const WarehouseConfig defaults;
        rhs.base_dir = node["base_dir"].as<std::filesystem::path>(defaults.base_dir);
        rhs.lowering_base_dir = node["lowering_base_dir"].as<std::string>(defaults.lowering_base_dir);
        rhs.transfer_logs_dir = node["transfer_logs_dir"].as<std::string>(defaults.transfer_logs_dir);
        rhs.username = node["username"].as<std::string>("");
        rhs.cruise_config_fn = node["cruise_config_fn"].as<std::string>(defaults.cruise_config_fn);
        rhs.md5_summary_fn = node["md5_summary_fn"].as<std::string>(defaults.md5_summary_fn);
        rhs.md5_summary_md5_fn = node["md5_summary_md5_fn"].as<std::string>(defaults.md5_summary_md5_fn);
        rhs.metadata_files = node["metadata_files"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<SchedulerConfig> {
    static Node encode(const SchedulerConfig& rhs) {
        Node node;
        node["transfer_interval_minutes"] = rhs.transfer_interval_minutes;
        node["startup_delay_seconds"] = rhs.startup_delay_seconds;
        node["retry_errored"] = rhs.retry_errored;
        node["include_outbound"] = rhs.include_outbound;
        return node;
    }

    static bool decode(const Node& node, SchedulerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.transfer_interval_minutes = node["transfer_interval_minutes"].as<unsigned int>(5);
        if (rhs.transfer_interval_minutes == 0) rhs.transfer_interval_minutes = 1;
        rhs.startup_delay_seconds = node["startup_delay_seconds"].as<unsigned int>(10);
        rhs.retry_errored = node["retry_errored"].as<bool>(true);
        rhs.include_outbound = node["include_outbound"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SizeCacherConfig> {
    static Node encode(const SizeCacherConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["interval_seconds"] = rhs.interval_seconds;
        return node;
    }

    static bool decode(const Node& node, SizeCacherConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.interval_seconds = node["interval_seconds"].as<unsigned int>(10);
        return true;
    }
};

template<>
struct convert<FilterConfig> {
    static Node encode(const FilterConfig& rhs) {
        Node node;
        node["default_ignore"] = rhs.default_ignore;
        return node;
    }

    static bool decode(const Node& node, FilterConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["default_ignore"]) rhs.default_ignore = node["default_ignore"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<PostHookCommand> {
    static Node encode(const PostHookCommand& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["command"] = rhs.command;
        return node;
    }

    static bool decode(const Node& node, PostHookCommand& rhs) {
        if (!node.IsMap() || !node["command"]) return false;
        rhs.name = node["name"].as<std::string>("");
        rhs.command = node["command"].as<std::vector<std::string>>();
        return !rhs.command.empty();
    }
};

template<>
struct convert<PostHookEntry> {
    static Node encode(const PostHookEntry& rhs) {
        Node node;
        node["transfer_name"] = rhs.transfer_name;
        node["commands"] = rhs.commands;
        return node;
    }

    static bool decode(const Node& node, PostHookEntry& rhs) {
        if (!node.IsMap()) return false;
        rhs.transfer_name = node["transfer_name"].as<std::string>("");
        rhs.commands = node["commands"].as<std::vector<PostHookCommand>>(std::vector<PostHookCommand>{});
        return true;
    }
};

template<>
struct convert<CtlConfig> {
    static Node encode(const CtlConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["socket_path"] = rhs.socket_path;
        node["admin_group"] = rhs.admin_group;
        return node;
    }

    static bool decode(const Node& node, CtlConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.socket_path = node["socket_path"].as<std::string>("/run/openvdm/ctl.sock");
        rhs.admin_group = node["admin_group"].as<std::string>("openvdm");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ovdm"]     = to_std_string(spdlog::level::to_string_view(rhs.ovdm));
        node["sched"]    = to_std_string(spdlog::level::to_string_view(rhs.sched));
        node["queue"]    = to_std_string(spdlog::level::to_string_view(rhs.queue));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["filter"]   = to_std_string(spdlog::level::to_string_view(rhs.filter));
        node["state"]    = to_std_string(spdlog::level::to_string_view(rhs.state));
        node["hooks"]    = to_std_string(spdlog::level::to_string_view(rhs.hooks));
        node["cancel"]   = to_std_string(spdlog::level::to_string_view(rhs.cancel));
        node["proc"]     = to_std_string(spdlog::level::to_string_view(rhs.proc));
        node["db"]       = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["ctl"]      = to_std_string(spdlog::level::to_string_view(rhs.ctl));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ovdm     = levelOr(node["ovdm"], rhs.ovdm);
        rhs.sched    = levelOr(node["sched"], rhs.sched);
        rhs.queue    = levelOr(node["queue"], rhs.queue);
        rhs.transfer = levelOr(node["transfer"], rhs.transfer);
        rhs.filter   = levelOr(node["filter"], rhs.filter);
        rhs.state    = levelOr(node["state"], rhs.state);
        rhs.hooks    = levelOr(node["hooks"], rhs.hooks);
        rhs.cancel   = levelOr(node["cancel"], rhs.cancel);
        rhs.proc     = levelOr(node["proc"], rhs.proc);
        rhs.db       = levelOr(node["db"], rhs.db);
        rhs.ctl      = levelOr(node["ctl"], rhs.ctl);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.file_log_level));
        node["subsystem_levels"] = rhs.levels.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::filesystem::path>();
        rhs.levels.console_log_level = levelOr(node["console_log_level"], rhs.levels.console_log_level);
        rhs.levels.file_log_level = levelOr(node["file_log_level"], rhs.levels.file_log_level);
        if (node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.levels.subsystem_levels);
        return true;
    }
};

} // namespace YAML
