#pragma once

#include "config/Config.hpp"
#include "types/TrashedItem.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace trashy::engine {

using Order = config::ListOrder;

enum class MatchMode { Glob, Regex, Substring, Exact };

enum class EntryKind { Any, Files, Directories };

struct ListFilter {
    std::vector<std::string> patterns;      // any match selects
    MatchMode mode = MatchMode::Glob;
    std::optional<std::chrono::seconds> older_than;
    std::optional<std::chrono::seconds> newer_than;
    std::optional<uintmax_t> min_size;      // payload tree size in bytes
    std::optional<uintmax_t> max_size;
    EntryKind kind = EntryKind::Any;
    std::optional<std::filesystem::path> under;
    std::optional<size_t> limit;
    std::optional<Order> order;             // unset = configured default

    // False when the filter would select every item in the trash
    [[nodiscard]] bool constrains() const;
};

// A ListFilter compiled against a fixed "now"
class Matcher {
public:
    // Throws std::invalid_argument for an invalid regular expression
    Matcher(const ListFilter& filter, std::time_t now);

    [[nodiscard]] bool matches(const types::TrashedItem& item) const;

private:
    const ListFilter& filter_;
    std::time_t now_;
    std::vector<std::regex> regexes_;

    [[nodiscard]] bool matchesPatterns(const std::string& path, const std::string& name) const;
    [[nodiscard]] bool matchesSize(const types::TrashedItem& item) const;
};

void sortItems(std::vector<types::TrashedItem>& items, Order order);

}
