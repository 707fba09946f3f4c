#pragma once

#include "cli/types.hpp"
#include "engine/Filter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trashy::cli {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult failed(std::string out, std::string err);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// Flags accepted by `command`, global ones included; used to reject typos
[[nodiscard]] std::optional<std::string> unknownFlag(const CommandCall& c, const std::vector<std::string>& allowed);

// Positionals as patterns plus the filter flags shared by list, restore and empty.
// Throws std::invalid_argument on malformed values.
engine::ListFilter parseListFilter(const CommandCall& c);

// "--index 0,3,7" -> {0, 3, 7}; throws std::invalid_argument
std::vector<size_t> parseIndexes(const std::string& s);

extern const std::vector<std::string> FILTER_FLAGS;
extern const std::vector<std::string> GLOBAL_FLAGS;

}
