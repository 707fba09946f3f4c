#include "config/paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace trashy::paths {

static std::filesystem::path envPath(const char* name) {
    if (const char* v = std::getenv(name); v && *v) return v;
    return {};
}

std::filesystem::path getHomeDir() {
    if (auto home = envPath("HOME"); !home.empty()) return home;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return "/";
}

std::filesystem::path getDataHome() {
    if (auto xdg = envPath("XDG_DATA_HOME"); !xdg.empty() && xdg.is_absolute()) return xdg;
    return getHomeDir() / ".local" / "share";
}

std::filesystem::path getConfigPath() {
    if (auto explicitPath = envPath("TRASHY_CONFIG"); !explicitPath.empty()) return explicitPath;
    if (auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty() && xdg.is_absolute())
        return xdg / "trashy" / "config.yaml";
    return getHomeDir() / ".config" / "trashy" / "config.yaml";
}

std::filesystem::path getDefaultHomeTrash() {
    return getDataHome() / "Trash";
}

}
