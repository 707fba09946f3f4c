#pragma once

#include "cli/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace trashy::cli {

// Flags that consume the following token as their value
const std::unordered_set<std::string>& valueFlags();

// Splits --key=value and glued -Xvalue, keeps everything else as-is
std::vector<std::string> normalizeArgs(int argc, char** argv, int start = 1);

// Builds a call from normalized tokens. The command name is left empty; Router picks it.
CommandCall parseArgs(const std::vector<std::string>& tokens);

}
