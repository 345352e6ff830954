#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>

namespace ovdm::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;
    const auto& logDir = cnf.log_dir;

    spdlog::info("[LogRegistry] Initializing... LogDir: {}", logDir.string());

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (logDir / "ovdm.log").string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("ovdm", sub_levels.ovdm);
    makeLogger("sched", sub_levels.sched);
    makeLogger("queue", sub_levels.queue);
    makeLogger("transfer", sub_levels.transfer);
    makeLogger("filter", sub_levels.filter);
    makeLogger("state", sub_levels.state);
    makeLogger("hooks", sub_levels.hooks);
    makeLogger("cancel", sub_levels.cancel);
    makeLogger("proc", sub_levels.proc);
    makeLogger("db", sub_levels.db);
    makeLogger("ctl", sub_levels.ctl);

    initialized_ = true;
    ovdm()->info("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
