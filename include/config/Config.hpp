#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace trashy::config {

constexpr static unsigned int DEFAULT_MAX_NAME_ATTEMPTS = 100;

enum class CrossDevicePolicy { Copy, Refuse };

enum class ListOrder { NewestFirst, OldestFirst, Path };

struct TrashConfig {
    std::filesystem::path home_dir{};   // empty = $XDG_DATA_HOME/Trash
    bool use_topdir_trash = true;       // per-volume stores on mounts other than the home device
    std::chrono::days retention_days = std::chrono::days(30);
    unsigned int max_name_attempts = DEFAULT_MAX_NAME_ATTEMPTS;
};

struct RestoreConfig {
    CrossDevicePolicy cross_device = CrossDevicePolicy::Copy;
    bool recreate_parents = true;
};

struct ListConfig {
    ListOrder default_order = ListOrder::NewestFirst;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum trashy = spdlog::level::info;   // Front-end lifecycle
    spdlog::level::level_enum engine = spdlog::level::info;   // put/restore/purge outcomes
    spdlog::level::level_enum store  = spdlog::level::info;   // Reservations, scan issues
    spdlog::level::level_enum volume = spdlog::level::info;   // Mount resolution
    spdlog::level::level_enum cli    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};    // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    TrashConfig trash;
    RestoreConfig restore;
    ListConfig list;
    LoggingConfig logging;
};

// Missing file yields defaults; malformed YAML throws YAML::Exception
Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);
std::string dumpConfig(const Config& cfg);

const char* to_string(CrossDevicePolicy policy);
CrossDevicePolicy crossDevicePolicyFromString(const std::string& s);
const char* to_string(ListOrder order);
ListOrder listOrderFromString(const std::string& s);

}
