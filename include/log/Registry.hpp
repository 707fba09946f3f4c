#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace trashy::log {

class Registry {
public:
    // Initialize all loggers from the registered config
    static void init();
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> trashy() { return get("trashy"); }
    static std::shared_ptr<spdlog::logger> engine() { return get("engine"); }
    static std::shared_ptr<spdlog::logger> store()  { return get("store"); }
    static std::shared_ptr<spdlog::logger> volume() { return get("volume"); }
    static std::shared_ptr<spdlog::logger> cli()    { return get("cli"); }


    static void setConsoleLevel(spdlog::level::level_enum lvl);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // stdout carries command output, so console logging goes to stderr
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 3;
};

}
