#pragma once

#include <string>
#include <vector>

namespace trashy::cli {

// A labeled option, e.g. {"--older-than <dur>", "Only items trashed more than <dur> ago", {}}
struct Entry {
    std::string label;
    std::string desc;
    std::vector<std::string> aliases;
};

struct Example {
    std::string cmd;
    std::string note;
};

struct CommandUsage {
    std::string command;
    std::vector<std::string> aliases;
    std::string description;
    std::string synopsis;
    std::vector<Entry> options;
    std::vector<Example> examples;

    [[nodiscard]] std::string toText() const;

    // One line for the command overview
    [[nodiscard]] std::string summaryLine(std::size_t nameWidth) const;
};

}
