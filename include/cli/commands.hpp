#pragma once

#include "cli/Router.hpp"
#include "engine/Engine.hpp"

#include <nlohmann/json.hpp>

namespace trashy::cli {

// Registers put, list, restore, empty and check against `engine`; `put` is the fallback
void registerCommands(Router& router, engine::Engine& engine);

nlohmann::json itemToJson(const types::TrashedItem& item, size_t index);

int terminalWidth();

}
