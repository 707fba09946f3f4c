#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace trashy::config {

static Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["trash"]) YAML::convert<TrashConfig>::decode(node, cfg.trash);
    if (auto node = root["restore"]) YAML::convert<RestoreConfig>::decode(node, cfg.restore);
    if (auto node = root["list"]) YAML::convert<ListConfig>::decode(node, cfg.list);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) return {};
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["trash"] = YAML::convert<TrashConfig>::encode(cfg.trash);
    root["restore"] = YAML::convert<RestoreConfig>::encode(cfg.restore);
    root["list"] = YAML::convert<ListConfig>::encode(cfg.list);
    root["logging"] = YAML::convert<LoggingConfig>::encode(cfg.logging);

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

const char* to_string(const CrossDevicePolicy policy) {
    switch (policy) {
        case CrossDevicePolicy::Copy: return "copy";
        case CrossDevicePolicy::Refuse: return "refuse";
    }
    return "copy";
}

CrossDevicePolicy crossDevicePolicyFromString(const std::string& s) {
    if (s == "copy") return CrossDevicePolicy::Copy;
    if (s == "refuse") return CrossDevicePolicy::Refuse;
    throw std::invalid_argument("Unknown cross_device policy: " + s);
}

const char* to_string(const ListOrder order) {
    switch (order) {
        case ListOrder::NewestFirst: return "newest_first";
        case ListOrder::OldestFirst: return "oldest_first";
        case ListOrder::Path: return "path";
    }
    return "newest_first";
}

ListOrder listOrderFromString(const std::string& s) {
    if (s == "newest_first") return ListOrder::NewestFirst;
    if (s == "oldest_first") return ListOrder::OldestFirst;
    if (s == "path") return ListOrder::Path;
    throw std::invalid_argument("Unknown list order: " + s);
}

}
