#include "engine/Filter.hpp"
#include "io/Transfer.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <charconv>
#include <fnmatch.h>
#include <stdexcept>
#include <string_view>
#include <utility>

using namespace trashy::engine;
using namespace trashy::types;
using trashy::log::Registry;

bool ListFilter::constrains() const {
    return !patterns.empty() || older_than || newer_than || min_size || max_size
        || kind != EntryKind::Any || under || limit;
}

Matcher::Matcher(const ListFilter& filter, const std::time_t now) : filter_(filter), now_(now) {
    if (filter_.mode != MatchMode::Regex) return;
    regexes_.reserve(filter_.patterns.size());
    for (const auto& p : filter_.patterns) {
        try {
            regexes_.emplace_back(p, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Invalid regular expression '" + p + "': " + e.what());
        }
    }
}

// Glob and Exact patterns without a slash name the entry, not its location
static const std::string& subjectFor(const std::string& pattern, const std::string& path, const std::string& name) {
    return pattern.find('/') == std::string::npos ? name : path;
}

bool Matcher::matchesPatterns(const std::string& path, const std::string& name) const {
    if (filter_.patterns.empty()) return true;

    switch (filter_.mode) {
    case MatchMode::Glob:
        return std::ranges::any_of(filter_.patterns, [&](const std::string& p) {
            return ::fnmatch(p.c_str(), subjectFor(p, path, name).c_str(), 0) == 0;
        });
    case MatchMode::Regex:
        return std::ranges::any_of(regexes_, [&](const std::regex& rx) { return std::regex_search(path, rx); });
    case MatchMode::Substring:
        return std::ranges::any_of(filter_.patterns, [&](const std::string& p) { return path.find(p) != std::string::npos; });
    case MatchMode::Exact:
        return std::ranges::any_of(filter_.patterns, [&](const std::string& p) { return subjectFor(p, path, name) == p; });
    }
    return false;
}

bool Matcher::matchesSize(const TrashedItem& item) const {
    if (!filter_.min_size && !filter_.max_size) return true;
    try {
        const auto bytes = io::treeStats(item.payload_path).bytes;
        if (filter_.min_size && bytes < *filter_.min_size) return false;
        if (filter_.max_size && bytes > *filter_.max_size) return false;
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        Registry::engine()->debug("[Matcher] Cannot size {}: {}", item.payload_path.string(), e.what());
        return false;
    }
}

bool Matcher::matches(const TrashedItem& item) const {
    const auto age = std::chrono::seconds(now_ - item.deleted_at);
    if (filter_.older_than && age < *filter_.older_than) return false;
    if (filter_.newer_than && age > *filter_.newer_than) return false;

    if (filter_.under && !util::isWithin(item.original_path, *filter_.under)) return false;
    if (!matchesPatterns(item.original_path.string(), item.original_path.filename().string())) return false;

    if (filter_.kind == EntryKind::Files && item.isDirectory()) return false;
    if (filter_.kind == EntryKind::Directories && !item.isDirectory()) return false;

    return matchesSize(item);
}

// "name.12" -> {"name", 12}; an id without a numeric suffix is attempt 0 of itself
static std::pair<std::string_view, unsigned long> splitId(const std::string& id) {
    const std::string_view sv(id);
    const auto dot = sv.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == sv.size()) return {sv, 0};

    unsigned long n = 0;
    const auto* first = sv.data() + dot + 1;
    const auto* last = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(first, last, n);
    if (ec != std::errc() || ptr != last) return {sv, 0};
    return {sv.substr(0, dot), n};
}

// Trash order among ids sharing a deletion second: name, name.1, name.2, ..., name.10
static bool trashedBefore(const std::string& a, const std::string& b) {
    const auto [baseA, nA] = splitId(a);
    const auto [baseB, nB] = splitId(b);
    if (baseA != baseB) return baseA < baseB;
    return nA < nB;
}

void trashy::engine::sortItems(std::vector<TrashedItem>& items, const Order order) {
    switch (order) {
    case Order::NewestFirst:
        std::ranges::stable_sort(items, [](const auto& a, const auto& b) {
            if (a.deleted_at != b.deleted_at) return a.deleted_at > b.deleted_at;
            return trashedBefore(b.id, a.id);
        });
        break;
    case Order::OldestFirst:
        std::ranges::stable_sort(items, [](const auto& a, const auto& b) {
            if (a.deleted_at != b.deleted_at) return a.deleted_at < b.deleted_at;
            return trashedBefore(a.id, b.id);
        });
        break;
    case Order::Path:
        std::ranges::stable_sort(items, [](const auto& a, const auto& b) {
            if (a.original_path != b.original_path) return a.original_path < b.original_path;
            return a.deleted_at > b.deleted_at;
        });
        break;
    }
}
