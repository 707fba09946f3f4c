#include "cli/CommandUsage.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace trashy::cli;

static std::string joinLabel(const Entry& e) {
    std::string out = e.label;
    for (const auto& a : e.aliases) out += ", " + a;
    return out;
}

std::string CommandUsage::toText() const {
    std::string out = fmt::format("Usage: {}\n\n{}\n", synopsis, description);

    if (!aliases.empty()) {
        out += "\nAliases: ";
        for (size_t i = 0; i < aliases.size(); ++i) out += (i ? ", " : "") + aliases[i];
        out += '\n';
    }

    if (!options.empty()) {
        size_t keyWidth = 0;
        for (const auto& e : options) keyWidth = std::max(keyWidth, joinLabel(e).size());
        keyWidth = std::min<size_t>(keyWidth, 30);

        out += "\nOptions:\n";
        for (const auto& e : options) {
            const auto key = joinLabel(e);
            if (key.size() > keyWidth) out += fmt::format("  {}\n  {:<{}}  {}\n", key, "", keyWidth, e.desc);
            else out += fmt::format("  {:<{}}  {}\n", key, keyWidth, e.desc);
        }
    }

    if (!examples.empty()) {
        out += "\nExamples:\n";
        for (const auto& [cmd, note] : examples) {
            out += fmt::format("  {}\n", cmd);
            if (!note.empty()) out += fmt::format("      {}\n", note);
        }
    }
    return out;
}

std::string CommandUsage::summaryLine(const std::size_t nameWidth) const {
    const auto firstLine = description.substr(0, description.find('\n'));
    return fmt::format("  {:<{}}  {}\n", command, nameWidth, firstLine);
}
