#pragma once

#include <filesystem>

namespace trashy::paths {

std::filesystem::path getHomeDir();

// $XDG_DATA_HOME, falling back to ~/.local/share
std::filesystem::path getDataHome();

// $TRASHY_CONFIG, else $XDG_CONFIG_HOME/trashy/config.yaml, else ~/.config/trashy/config.yaml
std::filesystem::path getConfigPath();

std::filesystem::path getDefaultHomeTrash();

}
