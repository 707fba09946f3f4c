#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace YAML {

using namespace trashy::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline std::string level_string(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

template<>
struct convert<TrashConfig> {
    static Node encode(const TrashConfig& rhs) {
        Node node;
        node["home_dir"] = rhs.home_dir.string();
        node["use_topdir_trash"] = rhs.use_topdir_trash;
        node["retention_days"] = rhs.retention_days.count();
        node["max_name_attempts"] = rhs.max_name_attempts;
        return node;
    }

    static bool decode(const Node& node, TrashConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.home_dir = node["home_dir"].as<std::string>("");
        rhs.use_topdir_trash = node["use_topdir_trash"].as<bool>(true);
        const auto retention = node["retention_days"].as<long>(30);
        if (retention < 0) throw std::invalid_argument("trash.retention_days must not be negative");
        rhs.retention_days = std::chrono::days(retention);
        rhs.max_name_attempts = node["max_name_attempts"].as<unsigned int>(DEFAULT_MAX_NAME_ATTEMPTS);
        if (rhs.max_name_attempts == 0) rhs.max_name_attempts = 1;
        return true;
    }
};

template<>
struct convert<RestoreConfig> {
    static Node encode(const RestoreConfig& rhs) {
        Node node;
        node["cross_device"] = std::string(to_string(rhs.cross_device));
        node["recreate_parents"] = rhs.recreate_parents;
        return node;
    }

    static bool decode(const Node& node, RestoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cross_device = crossDevicePolicyFromString(node["cross_device"].as<std::string>("copy"));
        rhs.recreate_parents = node["recreate_parents"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ListConfig> {
    static Node encode(const ListConfig& rhs) {
        Node node;
        node["default_order"] = std::string(to_string(rhs.default_order));
        return node;
    }

    static bool decode(const Node& node, ListConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_order = listOrderFromString(node["default_order"].as<std::string>("newest_first"));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["trashy"] = level_string(rhs.trashy);
        node["engine"] = level_string(rhs.engine);
        node["store"]  = level_string(rhs.store);
        node["volume"] = level_string(rhs.volume);
        node["cli"]    = level_string(rhs.cli);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.trashy = spdlog::level::from_str(node["trashy"].as<std::string>("info"));
        rhs.engine = spdlog::level::from_str(node["engine"].as<std::string>("info"));
        rhs.store  = spdlog::level::from_str(node["store"].as<std::string>("info"));
        rhs.volume = spdlog::level::from_str(node["volume"].as<std::string>("info"));
        rhs.cli    = spdlog::level::from_str(node["cli"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = level_string(rhs.console_log_level);
        node["file_log_level"]    = level_string(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
