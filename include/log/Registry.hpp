#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace ovdm::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> ovdm()      { return get("ovdm"); }
    static std::shared_ptr<spdlog::logger> sched()     { return get("sched"); }
    static std::shared_ptr<spdlog::logger> queue()     { return get("queue"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> filter()    { return get("filter"); }
    static std::shared_ptr<spdlog::logger> state()     { return get("state"); }
    static std::shared_ptr<spdlog::logger> hooks()     { return get("hooks"); }
    static std::shared_ptr<spdlog::logger> cancel()    { return get("cancel"); }
    static std::shared_ptr<spdlog::logger> proc()      { return get("proc"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }
    static std::shared_ptr<spdlog::logger> ctl()       { return get("ctl"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
