#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace trashy::log {

void Registry::init() {
    init(config::ConfigRegistry::get().logging);
}

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::debug("[Registry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(cnf.log_dir, ec);
        if (ec) throw std::runtime_error("[Registry] Cannot create log directory " + cnf.log_dir.string() + ": " + ec.message());

        main_log_path_ = cnf.log_dir / "trashy.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("trashy", sub_levels.trashy);
    makeLogger("engine", sub_levels.engine);
    makeLogger("store",  sub_levels.store);
    makeLogger("volume", sub_levels.volume);
    makeLogger("cli",    sub_levels.cli);

    initialized_ = true;
    trashy()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setConsoleLevel(const spdlog::level::level_enum lvl) {
    if (!initialized_) return;
    console_sink_->set_level(lvl);
    spdlog::apply_all([lvl](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > lvl) lg->set_level(lvl);
    });
}

}
