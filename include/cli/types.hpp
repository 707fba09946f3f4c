#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace trashy::cli {

struct FlagKV {
    std::string key;                    // without leading dashes
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
    bool literal = false;               // "--" preceded every positional, so none names a command

    // Asks a yes/no question on the terminal; unset when input is not interactive
    std::function<bool(const std::string&)> confirm;
};

struct CommandResult {
    int exit_code = 0;                  // 0 ok, 1 operation failure, 2 usage error
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;                // machine-readable payload for --json
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

}
