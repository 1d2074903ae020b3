#pragma once

#include "types/ServerConfig.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace ferry::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const types::LoggingConfig& config = {});

    // Drops every logger; later lookups get the silent fallback until init() runs again.
    static void shutdown();

    // Generic access by name. Before init() this returns a logger that discards
    // everything, so library code can log without a configured registry.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> ferry()    { return get("ferry"); }
    static std::shared_ptr<spdlog::logger> runtime()  { return get("runtime"); }
    static std::shared_ptr<spdlog::logger> engine()   { return get("engine"); }
    static std::shared_ptr<spdlog::logger> cli()      { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    // Console sink level only; the file sink always records debug and above.
    static void setLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> silent();

    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline std::atomic<bool> initialized_{false};

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t max_file_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 5;
};

}
