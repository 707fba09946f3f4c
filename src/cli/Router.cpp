#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace trashy::cli;
using trashy::log::Registry;

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const auto key = usage.command;

    for (const auto& alias : usage.aliases) {
        if (aliasMap_.contains(alias) && aliasMap_.at(alias) != key) {
            Registry::cli()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                  alias, aliasMap_.at(alias), key);
            continue;
        }
        aliasMap_[alias] = key;
    }

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    if (commands_.contains(nameOrAlias)) return nameOrAlias;
    if (aliasMap_.contains(nameOrAlias)) return aliasMap_.at(nameOrAlias);
    return {};
}

bool Router::isCommand(const std::string& nameOrAlias) const { return !canonicalFor(nameOrAlias).empty(); }

CommandResult Router::execute(CommandCall call) const {
    if (!call.literal && !call.positionals.empty()) {
        if (const auto canonical = canonicalFor(call.positionals.front()); !canonical.empty()) {
            call.name = canonical;
            call.positionals.erase(call.positionals.begin());
        }
    }

    if (call.name.empty()) {
        if (hasFlag(call, std::vector<std::string>{"h", "help"})) return ok(renderHelp());
        if (call.positionals.empty() || fallback_.empty()) return {2, renderHelp(), ""};
        call.name = fallback_;
    }

    if (hasFlag(call, std::vector<std::string>{"h", "help"})) return ok(renderHelp(call.name));

    Registry::cli()->debug("[Router] Executing command: '{}'", call.name);
    return commands_.at(call.name).handler(call);
}

std::string Router::renderHelp(const std::string& command) const {
    if (const auto canonical = canonicalFor(command); !canonical.empty())
        return commands_.at(canonical).usage.toText();

    size_t width = 0;
    for (const auto& name : order_) width = std::max(width, name.size());

    std::string out = "Usage: trashy [--config PATH] [-v] <command> [args...]\n"
                      "       trashy <path>...\n\nCommands:\n";
    for (const auto& name : order_) out += commands_.at(name).usage.summaryLine(width);
    out += "\nRun 'trashy <command> --help' for details.\n";
    return out;
}
