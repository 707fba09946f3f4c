#pragma once

#include "cli/CommandUsage.hpp"
#include "cli/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace trashy::cli {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    // The first positional selects the command; anything else is handed to `fallback`
    [[nodiscard]] CommandResult execute(CommandCall call) const;

    void setFallback(std::string command) { fallback_ = std::move(command); }

    [[nodiscard]] bool isCommand(const std::string& nameOrAlias) const;

    [[nodiscard]] std::string renderHelp(const std::string& command = {}) const;

private:
    struct CommandInfo {
        CommandUsage usage;
        CommandHandler handler;
    };

    std::vector<std::string> order_;                        // registration order, for help
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::string fallback_;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;
};

}
