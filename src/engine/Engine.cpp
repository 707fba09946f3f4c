#include "engine/Engine.hpp"
#include "io/Transfer.hpp"
#include "types/Error.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <map>
#include <stdexcept>
#include <unordered_set>

using namespace trashy::engine;
using namespace trashy::types;
using trashy::log::Registry;
using trashy::store::Store;

namespace fs = std::filesystem;

static bool entryExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

PurgeSelector PurgeSelector::of(TrashedItem item) {
    PurgeSelector sel;
    sel.kind = Kind::Item;
    sel.item = std::move(item);
    return sel;
}

PurgeSelector PurgeSelector::matching(ListFilter filter) {
    PurgeSelector sel;
    sel.kind = Kind::Filter;
    sel.filter = std::move(filter);
    return sel;
}

PurgeSelector PurgeSelector::everything() { return {}; }

Engine::Engine(std::shared_ptr<Context> ctx) : ctx_(std::move(ctx)) {
    if (!ctx_) throw std::invalid_argument("Engine requires a context");
}

std::vector<Store> Engine::stores() {
    std::vector<Store> out;
    for (const auto& r : ctx_->resolver().knownStores()) {
        Store s(r.store_root, r.topdir);
        if (s.exists()) out.push_back(std::move(s));
    }
    return out;
}

// ---------------------------------------------------------------------------
// put
// ---------------------------------------------------------------------------

TrashedItem Engine::put(const fs::path& path) {
    const auto abs = util::makeAbsolute(path);
    const auto base = abs.filename().string();
    if (abs.empty() || abs == abs.root_path() || base.empty() || base == "." || base == "..")
        throw Error(ErrorCode::InvalidPath, "Refusing to trash '" + path.string() + "'", path);

    std::error_code ec;
    const auto st = fs::symlink_status(abs, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw Error::fromErrno(ec.value(), "Cannot access", abs, ErrorCode::PermissionDenied);
    if (!fs::exists(st)) throw Error(ErrorCode::NotFound, "No such file or directory: '" + abs.string() + "'", abs);

    const auto original = util::canonicalParent(abs);
    const auto res = ctx_->resolver().resolve(abs);

    // Trashing the store itself, anything inside it, or one of its ancestors would recurse
    const auto storeRoot = fs::weakly_canonical(res.store_root, ec);
    const auto& rootForCheck = ec ? res.store_root : storeRoot;
    if (util::isSameOrWithin(original, rootForCheck) || util::isWithin(rootForCheck, original))
        throw Error(ErrorCode::InvalidPath, "Refusing to trash the trash itself: '" + abs.string() + "'", abs);

    const Store store(res.store_root, res.topdir);
    store.ensureLayout();

    auto item = commitWithFreeName(store, abs, original);
    Registry::engine()->info("[Engine] Trashed {} as {} in {}", item.original_path.string(), item.id,
                             store.root().string());
    return item;
}

TrashedItem Engine::commitWithFreeName(const Store& store, const fs::path& source, const fs::path& originalPath) {
    const auto& namer = ctx_->namer();
    const auto base = source.filename().string();

    unsigned int from = 0;
    while (true) {
        const auto attempt = namer.nextFree(store, base, from);
        if (!attempt)
            throw Error(ErrorCode::NameExhausted,
                        fmt::format("No free trash name for '{}' after {} attempts", base, namer.maxAttempts()),
                        source);

        const auto name = namer.candidate(base, *attempt);
        try {
            const auto reservation = store.reserve(name);
            return store.commit(reservation, source, originalPath, util::now());
        } catch (const Error& e) {
            if (e.code() != ErrorCode::NameTaken) throw;
            Registry::engine()->debug("[Engine] Lost race for name {}, retrying", name);
            from = *attempt + 1;
        }
    }
}

// ---------------------------------------------------------------------------
// list / scan
// ---------------------------------------------------------------------------

std::vector<TrashedItem> Engine::list(const ListFilter& filter, const store::IssueHandler& onIssue) {
    const Matcher matcher(filter, util::now());
    std::vector<TrashedItem> items;

    for (const auto& store : stores())
        for (const auto& item : store.list(onIssue))
            if (matcher.matches(item)) items.push_back(item);

    sortItems(items, filter.order.value_or(ctx_->config().list.default_order));
    if (filter.limit && items.size() > *filter.limit) items.resize(*filter.limit);
    return items;
}

size_t Engine::scan(const ListFilter& filter, const ItemVisitor& visitor, const store::IssueHandler& onIssue) {
    const Matcher matcher(filter, util::now());
    size_t visited = 0;

    for (const auto& store : stores()) {
        for (const auto& item : store.list(onIssue)) {
            if (!matcher.matches(item)) continue;
            ++visited;
            if (!visitor(item) || (filter.limit && visited >= *filter.limit)) return visited;
        }
    }
    return visited;
}

// ---------------------------------------------------------------------------
// restore
// ---------------------------------------------------------------------------

fs::path Engine::restore(const TrashedItem& item, const std::optional<fs::path>& destination) {
    const auto target = destination ? util::makeAbsolute(*destination) : item.original_path;
    if (target.empty() || !target.is_absolute() || !target.has_filename())
        throw Error(ErrorCode::InvalidPath, "Invalid restore destination: '" + target.string() + "'", target);

    if (entryExists(target))
        throw Error(ErrorCode::DestinationExists, "Destination already exists: '" + target.string() + "'", target);

    const Store store(item.store_root);
    const auto [payload, info] = store.release(item);
    if (!entryExists(info))
        throw Error(ErrorCode::NotFound, "Item is no longer in the trash: '" + item.id + "'", info);
    if (!entryExists(payload))
        throw Error(ErrorCode::OrphanedMetadata, "Trashed payload is missing for '" + item.id + "'", payload);

    const auto parent = target.parent_path();
    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        if (!ctx_->config().restore.recreate_parents)
            throw Error(ErrorCode::NotFound, "Parent directory does not exist: '" + parent.string() + "'", parent);
        fs::create_directories(parent, ec);
        if (ec) throw Error::fromErrno(ec.value(), "Cannot recreate parent directory", parent,
                                       ErrorCode::PermissionDenied);
    }

    moveBack(item, target);

    try {
        store.removeRecord(item);
    } catch (const Error& e) {
        Registry::engine()->warn("[Engine] Restored {} but could not drop its record: {}", target.string(), e.what());
    }

    Registry::engine()->info("[Engine] Restored {} to {}", item.id, target.string());
    return target;
}

void Engine::moveBack(const TrashedItem& item, const fs::path& target) {
    const int err = io::moveNoReplace(item.payload_path, target);
    if (err == 0) return;

    if (err == EEXIST || err == ENOTEMPTY)
        throw Error(ErrorCode::DestinationExists, "Destination already exists: '" + target.string() + "'", target);

    if (err != EXDEV) throw Error::fromErrno(err, "Cannot restore to '" + target.string() + "' from", item.payload_path);

    if (ctx_->config().restore.cross_device == config::CrossDevicePolicy::Refuse)
        throw Error(ErrorCode::CrossDevice,
                    "Restore destination '" + target.string() + "' is on another filesystem", target);

    Registry::engine()->debug("[Engine] Copying {} across filesystems", item.id);
    if (!io::crossDeviceMove(item.payload_path, target))
        Registry::engine()->warn("[Engine] Restored copy of {} is in place, but the trashed payload "
                                 "could not be fully removed", item.id);
}

// ---------------------------------------------------------------------------
// purge
// ---------------------------------------------------------------------------

size_t Engine::purge(const PurgeSelector& selector, const bool confirmed) {
    switch (selector.kind) {
    case PurgeSelector::Kind::Item: {
        if (!selector.item) throw std::invalid_argument("Item purge without an item");
        const Store store(selector.item->store_root);
        store.remove(*selector.item);
        Registry::engine()->info("[Engine] Purged {}", selector.item->id);
        return 1;
    }
    case PurgeSelector::Kind::Filter:
        if (!selector.filter.constrains() && !confirmed)
            throw Error(ErrorCode::NotConfirmed, "Purging the whole trash requires confirmation");
        return purgeItems(list(selector.filter));
    case PurgeSelector::Kind::All: {
        if (!confirmed) throw Error(ErrorCode::NotConfirmed, "Emptying the trash requires confirmation");
        size_t leftovers = 0;
        for (const auto& store : stores()) leftovers += store.removeLeftovers();
        if (leftovers) Registry::engine()->info("[Engine] Removed {} leftover entries", leftovers);
        return purgeItems(list());
    }
    }
    return 0;
}

size_t Engine::purgeItems(const std::vector<TrashedItem>& items) {
    size_t purged = 0;
    std::optional<Error> first;
    size_t failed = 0;

    for (const auto& item : items) {
        try {
            Store(item.store_root).remove(item);
            ++purged;
        } catch (const Error& e) {
            Registry::engine()->error("[Engine] Failed to purge {}: {}", item.id, e.what());
            if (!first) first = e;
            ++failed;
        }
    }

    std::unordered_set<std::string> swept;
    for (const auto& item : items) {
        if (!swept.insert(item.store_root.string()).second) continue;
        const auto n = Store(item.store_root).sweepExpunged();
        if (n) Registry::engine()->debug("[Engine] Swept {} leftovers in {}", n, item.store_root.string());
    }

    Registry::engine()->info("[Engine] Purged {} of {} items", purged, items.size());

    if (first)
        throw Error(first->code(),
                    fmt::format("{} of {} items could not be purged; first failure: {}", failed, items.size(),
                                first->what()),
                    first->path());
    return purged;
}

size_t Engine::purgeExpired() {
    const auto days = ctx_->config().trash.retention_days;
    if (days.count() <= 0) return 0;

    ListFilter filter;
    filter.older_than = std::chrono::duration_cast<std::chrono::seconds>(days);
    return purge(PurgeSelector::matching(std::move(filter)));
}

// ---------------------------------------------------------------------------
// check
// ---------------------------------------------------------------------------

std::vector<trashy::store::ScanIssue> Engine::check() {
    std::vector<store::ScanIssue> issues;
    const auto collect = [&](const store::ScanIssue& issue) { issues.push_back(issue); };

    std::map<fs::path, std::vector<TrashedItem>> byParent;
    for (const auto& store : stores()) {
        for (const auto& item : store.list(collect)) byParent[item.original_path.parent_path()].push_back(item);
        for (auto& orphan : store.orphanedPayloads()) issues.push_back(std::move(orphan));
    }

    // Partial copies of an interrupted cross-device restore sit next to the original location
    for (const auto& [parent, items] : byParent) {
        std::error_code ec;
        for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
            const auto match = std::ranges::find_if(items, [&](const TrashedItem& item) {
                return io::isStagingPathFor(it->path(), item.original_path);
            });
            if (match != items.end())
                issues.push_back({store::IssueKind::IncompleteRestore, match->id, it->path(),
                                  "partial copy of an interrupted restore"});
        }
    }
    return issues;
}
