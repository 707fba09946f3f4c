#include "cli/argsHelpers.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <stdexcept>

namespace trashy::cli {

const std::vector<std::string> FILTER_FLAGS{
    "glob", "regex", "substring", "exact", "older-than", "newer-than", "min-size", "max-size",
    "dirs", "files", "under", "oldest-first", "newest-first", "by-path", "n", "limit"
};

const std::vector<std::string> GLOBAL_FLAGS{ "config", "v", "verbose", "h", "help", "non-interactive" };

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult failed(std::string out, std::string err) { return {1, std::move(out), std::move(err)}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const FlagKV& kv) { return kv.key == key; });
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const std::string& k) { return hasFlag(c, k); });
}

std::optional<std::string> unknownFlag(const CommandCall& c, const std::vector<std::string>& allowed) {
    for (const auto& [k, v] : c.options) {
        if (std::ranges::find(allowed, k) != allowed.end()) continue;
        if (std::ranges::find(GLOBAL_FLAGS, k) != GLOBAL_FLAGS.end()) continue;
        return k;
    }
    return std::nullopt;
}

static std::string requireValue(const CommandCall& c, const std::string& key) {
    const auto v = optVal(c, key);
    if (!v || v->empty()) throw std::invalid_argument("--" + key + " requires a value");
    return *v;
}

engine::ListFilter parseListFilter(const CommandCall& c) {
    engine::ListFilter f;
    f.patterns = c.positionals;

    const int modes = hasFlag(c, "glob") + hasFlag(c, "regex") + hasFlag(c, "substring") + hasFlag(c, "exact");
    if (modes > 1) throw std::invalid_argument("--glob, --regex, --substring and --exact are mutually exclusive");
    if (hasFlag(c, "regex")) f.mode = engine::MatchMode::Regex;
    else if (hasFlag(c, "substring")) f.mode = engine::MatchMode::Substring;
    else if (hasFlag(c, "exact")) f.mode = engine::MatchMode::Exact;

    if (hasFlag(c, "older-than")) f.older_than = util::parseDuration(requireValue(c, "older-than"));
    if (hasFlag(c, "newer-than")) f.newer_than = util::parseDuration(requireValue(c, "newer-than"));
    if (hasFlag(c, "min-size")) f.min_size = util::parseSize(requireValue(c, "min-size"));
    if (hasFlag(c, "max-size")) f.max_size = util::parseSize(requireValue(c, "max-size"));

    if (hasFlag(c, "dirs") && hasFlag(c, "files")) throw std::invalid_argument("--dirs and --files are mutually exclusive");
    if (hasFlag(c, "dirs")) f.kind = engine::EntryKind::Directories;
    if (hasFlag(c, "files")) f.kind = engine::EntryKind::Files;

    if (hasFlag(c, "under")) f.under = std::filesystem::absolute(requireValue(c, "under")).lexically_normal();

    if (hasFlag(c, std::vector<std::string>{"n", "limit"})) {
        const auto key = hasFlag(c, "n") ? "n" : "limit";
        const auto n = util::parseUInt(requireValue(c, key));
        if (!n) throw std::invalid_argument(std::string("--") + key + " expects a non-negative integer");
        f.limit = *n;
    }

    if (hasFlag(c, "oldest-first")) f.order = engine::Order::OldestFirst;
    else if (hasFlag(c, "by-path")) f.order = engine::Order::Path;
    else if (hasFlag(c, "newest-first")) f.order = engine::Order::NewestFirst;

    return f;
}

std::vector<size_t> parseIndexes(const std::string& s) {
    std::vector<std::string> parts;
    boost::split(parts, s, boost::is_any_of(","), boost::token_compress_on);

    std::vector<size_t> out;
    for (auto& p : parts) {
        boost::trim(p);
        if (p.empty()) continue;
        const auto n = util::parseUInt(p);
        if (!n) throw std::invalid_argument("Invalid index: '" + p + "'");
        out.push_back(*n);
    }
    if (out.empty()) throw std::invalid_argument("--index requires at least one index");
    return out;
}

}
