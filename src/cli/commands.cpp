#include "cli/commands.hpp"
#include "cli/argsHelpers.hpp"
#include "cli/Table.hpp"
#include "io/Transfer.hpp"
#include "types/Error.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace trashy;
using namespace trashy::cli;
using namespace trashy::engine;
using trashy::log::Registry;
using trashy::types::TrashedItem;

namespace {

std::optional<uintmax_t> payloadBytes(const TrashedItem& item) {
    try {
        return io::treeStats(item.payload_path).bytes;
    } catch (const std::filesystem::filesystem_error& e) {
        Registry::cli()->debug("Cannot size {}: {}", item.payload_path.string(), e.what());
        return std::nullopt;
    }
}

std::string displayTime(const std::time_t ts) {
    auto s = util::localTimestamp(ts);
    if (const auto t = s.find('T'); t != std::string::npos) s[t] = ' ';
    return s;
}

std::string renderItems(const std::vector<TrashedItem>& items) {
    Table table({
        {"#", Align::Right},
        {"Deleted"},
        {"Size", Align::Right},
        {"Path", Align::Left, 8, std::numeric_limits<std::size_t>::max(), true}
    }, terminalWidth());

    for (size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        const auto bytes = payloadBytes(item);
        auto path = item.original_path.string();
        if (item.isDirectory()) path += '/';
        table.add_row({std::to_string(i), displayTime(item.deleted_at), bytes ? util::humanSize(*bytes) : "?", path});
    }
    return table.render();
}

struct IssueCounter {
    size_t count = 0;
    store::IssueHandler handler() { return [this](const store::ScanIssue&) { ++count; }; }
};

std::string skippedNote(const IssueCounter& issues) {
    if (!issues.count) return {};
    return fmt::format("{} damaged or incomplete entr{} skipped; run 'trashy check' for details",
                       issues.count, issues.count == 1 ? "y" : "ies");
}

CommandResult withNote(CommandResult res, const IssueCounter& issues) {
    const auto note = skippedNote(issues);
    if (!note.empty()) res.stderr_text += (res.stderr_text.empty() ? "" : "\n") + note;
    return res;
}

/* ----------------------------------------------------------------- */

CommandResult handlePut(const CommandCall& call, Engine& engine) {
    if (const auto bad = unknownFlag(call, {})) return invalid("put: unknown option --" + *bad);
    if (call.positionals.empty()) return invalid("put: no paths given");

    std::string err;
    size_t failures = 0;
    for (const auto& p : call.positionals) {
        try {
            const auto item = engine.put(p);
            Registry::cli()->debug("Trashed '{}' as {}", p, item.id);
        } catch (const std::exception& e) {
            ++failures;
            err += fmt::format("{}trashy: cannot trash '{}': {}", err.empty() ? "" : "\n", p, e.what());
        }
    }

    return failures ? failed("", err) : ok("");
}

CommandResult handleList(const CommandCall& call, Engine& engine) {
    if (const auto bad = unknownFlag(call, [] {
            auto allowed = FILTER_FLAGS;
            allowed.emplace_back("json");
            return allowed;
        }())) return invalid("list: unknown option --" + *bad);

    const auto filter = parseListFilter(call);
    IssueCounter issues;
    const auto items = engine.list(filter, issues.handler());

    if (hasFlag(call, "json")) {
        CommandResult res;
        res.data = nlohmann::json::array();
        for (size_t i = 0; i < items.size(); ++i) res.data.push_back(itemToJson(items[i], i));
        res.has_data = true;
        return withNote(std::move(res), issues);
    }

    if (items.empty())
        return withNote(ok(filter.constrains() ? "No matching items" : "Trash is empty"), issues);
    return withNote(ok(renderItems(items)), issues);
}

CommandResult handleRestore(const CommandCall& call, Engine& engine) {
    if (const auto bad = unknownFlag(call, [] {
            auto allowed = FILTER_FLAGS;
            allowed.insert(allowed.end(), {"index", "dest"});
            return allowed;
        }())) return invalid("restore: unknown option --" + *bad);

    const auto filter = parseListFilter(call);
    const bool byIndex = hasFlag(call, "index");
    if (!byIndex && !filter.constrains())
        return invalid("restore: give a pattern, a filter or --index (see 'trashy list')");

    IssueCounter issues;
    auto matches = engine.list(filter, issues.handler());

    std::vector<TrashedItem> selection;
    if (byIndex) {
        for (const auto idx : parseIndexes(optVal(call, "index").value_or(""))) {
            if (idx >= matches.size())
                return withNote(failed("", fmt::format("restore: no item at index {}", idx)), issues);
            selection.push_back(matches[idx]);
        }
    } else {
        selection = std::move(matches);
    }

    if (selection.empty()) return withNote(failed("", "restore: no matching items in trash"), issues);

    std::optional<std::filesystem::path> dest;
    if (const auto d = optVal(call, "dest")) {
        if (d->empty()) return invalid("restore: --dest requires a path");
        if (selection.size() > 1) return invalid("restore: --dest needs exactly one matching item");
        dest = *d;
    }

    std::string out, err;
    for (const auto& item : selection) {
        try {
            const auto target = engine.restore(item, dest);
            out += fmt::format("{}Restored {}", out.empty() ? "" : "\n", target.string());
        } catch (const std::exception& e) {
            err += fmt::format("{}trashy: cannot restore '{}': {}", err.empty() ? "" : "\n",
                               item.original_path.string(), e.what());
        }
    }

    return withNote(err.empty() ? ok(out) : failed(out, err), issues);
}

CommandResult handleEmpty(const CommandCall& call, Engine& engine) {
    if (const auto bad = unknownFlag(call, [] {
            auto allowed = FILTER_FLAGS;
            allowed.insert(allowed.end(), {"all", "expired", "yes", "y"});
            return allowed;
        }())) return invalid("empty: unknown option --" + *bad);

    const bool all = hasFlag(call, "all");
    const bool expired = hasFlag(call, "expired");
    const bool yes = hasFlag(call, std::vector<std::string>{"yes", "y"});
    const auto filter = parseListFilter(call);

    if (all + expired + filter.constrains() > 1)
        return invalid("empty: --all, --expired and filters are mutually exclusive");
    if (!all && !expired && !filter.constrains())
        return invalid("empty: give --all, --expired or a filter");

    const auto retention = engine.context()->config().trash.retention_days;
    if (expired && retention.count() == 0) return ok("Retention is disabled; nothing expires");

    ListFilter preview = filter;
    if (expired) preview.older_than = std::chrono::duration_cast<std::chrono::seconds>(retention);
    const auto count = engine.list(preview).size();
    if (count == 0) return ok("Nothing to purge");

    if (!yes) {
        if (!call.confirm)
            return failed("", "empty: refusing to delete without confirmation; re-run with --yes");
        if (!call.confirm(fmt::format("Permanently delete {} item{}?", count, count == 1 ? "" : "s")))
            return failed("", "Aborted");
    }

    size_t purged = 0;
    if (expired) purged = engine.purgeExpired();
    else if (all) purged = engine.purge(PurgeSelector::everything(), true);
    else purged = engine.purge(PurgeSelector::matching(filter), true);

    return ok(fmt::format("Purged {} item{}", purged, purged == 1 ? "" : "s"));
}

CommandResult handleCheck(const CommandCall& call, Engine& engine) {
    if (const auto bad = unknownFlag(call, {"json"})) return invalid("check: unknown option --" + *bad);

    const auto issues = engine.check();

    if (hasFlag(call, "json")) {
        CommandResult res;
        res.data = nlohmann::json::array();
        for (const auto& i : issues)
            res.data.push_back({
                {"kind", store::to_string(i.kind)},
                {"name", i.name},
                {"path", i.path.string()},
                {"detail", i.detail}
            });
        res.has_data = true;
        return res;
    }

    if (issues.empty()) return ok("No problems found");

    Table table({{"Kind"}, {"Entry"}, {"Detail", Align::Left, 8, std::numeric_limits<std::size_t>::max(), true}},
                terminalWidth());
    for (const auto& i : issues) table.add_row({store::to_string(i.kind), i.path.string(), i.detail});
    return ok(table.render());
}

}

/* ----------------------------------------------------------------- */

namespace trashy::cli {

int terminalWidth() {
    winsize ws{};
    if (::isatty(STDOUT_FILENO) == 1 && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 0;
}

nlohmann::json itemToJson(const TrashedItem& item, const size_t index) {
    nlohmann::json j{
        {"index", index},
        {"id", item.id},
        {"original_path", item.original_path.string()},
        {"deleted_at", util::localTimestamp(item.deleted_at)},
        {"deleted_at_utc", util::timestampToString(item.deleted_at)},
        {"deleted_at_epoch", static_cast<long long>(item.deleted_at)},
        {"is_dir", item.isDirectory()},
        {"store", item.store_root.string()}
    };
    if (const auto bytes = payloadBytes(item)) j["size"] = *bytes;
    else j["size"] = nullptr;
    return j;
}

static const std::vector<Entry> FILTER_ENTRIES{
    {"--glob", "Match patterns as shell globs (default)", {}},
    {"--regex", "Match patterns as regular expressions", {}},
    {"--substring", "Match patterns as substrings of the original path", {}},
    {"--exact", "Match patterns exactly", {}},
    {"--older-than <dur>", "Trashed more than <dur> ago (e.g. 90m, 12h, 7d, 2w)", {}},
    {"--newer-than <dur>", "Trashed less than <dur> ago", {}},
    {"--min-size <size>", "Payload at least <size> (e.g. 512K, 10M)", {}},
    {"--max-size <size>", "Payload at most <size>", {}},
    {"--dirs", "Directories only", {}},
    {"--files", "Non-directories only", {}},
    {"--under <dir>", "Originally located below <dir>", {}},
    {"--oldest-first", "Sort oldest first", {}},
    {"--by-path", "Sort by original path", {}},
    {"-n <count>", "Show at most <count> items", {"--limit"}},
};

void registerCommands(Router& router, Engine& engine) {
    router.registerCommand({
        "put", {"rm", "trash"},
        "Move files and directories to the trash of their volume.",
        "trashy put <path>...",
        {},
        {{"trashy put notes.txt build/", ""}, {"trashy -- -oddly-named-file", "Paths may also be given without a command"}}
    }, [&engine](const CommandCall& c) { return handlePut(c, engine); });

    auto listOptions = FILTER_ENTRIES;
    listOptions.push_back({"--json", "Print items as JSON", {}});
    router.registerCommand({
        "list", {"ls"},
        "List trashed items, newest first.\nPatterns without a '/' match the file name, others the full original path.",
        "trashy list [pattern...] [filters] [--json]",
        listOptions,
        {{"trashy list '*.log' --older-than 7d", ""}, {"trashy list --under ~/src --by-path", ""}}
    }, [&engine](const CommandCall& c) { return handleList(c, engine); });

    auto restoreOptions = FILTER_ENTRIES;
    restoreOptions.push_back({"--index <i,j,...>", "Restore items by their position in the matching list", {}});
    restoreOptions.push_back({"--dest <path>", "Restore a single item to <path> instead of its original location", {}});
    router.registerCommand({
        "restore", {"undo"},
        "Move trashed items back to where they came from. Existing files are never overwritten.",
        "trashy restore [pattern...] [--index <i,j,...>] [--dest <path>] [filters]",
        restoreOptions,
        {{"trashy restore notes.txt", ""}, {"trashy restore --index 0 --dest /tmp/notes.txt", ""}}
    }, [&engine](const CommandCall& c) { return handleRestore(c, engine); });

    auto emptyOptions = FILTER_ENTRIES;
    emptyOptions.push_back({"--all", "Delete everything in the trash", {}});
    emptyOptions.push_back({"--expired", "Delete items older than trash.retention_days", {}});
    emptyOptions.push_back({"--yes", "Do not ask for confirmation", {"-y"}});
    router.registerCommand({
        "empty", {"purge"},
        "Permanently delete trashed items.",
        "trashy empty (--all | --expired | [pattern...] [filters]) [--yes]",
        emptyOptions,
        {{"trashy empty --older-than 30d --yes", ""}, {"trashy empty --all", "Asks before deleting"}}
    }, [&engine](const CommandCall& c) { return handleEmpty(c, engine); });

    router.registerCommand({
        "check", {"fsck"},
        "Report pending, corrupt and orphaned entries in every trash store, and hidden\n"
        "'.<name>.trashy-restore.<pid>' copies left beside an original path by an interrupted restore.",
        "trashy check [--json]",
        {{"--json", "Print issues as JSON", {}}},
        {}
    }, [&engine](const CommandCall& c) { return handleCheck(c, engine); });

    router.setFallback("put");
}

}
