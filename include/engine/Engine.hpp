#pragma once

#include "engine/Context.hpp"
#include "engine/Filter.hpp"
#include "store/Store.hpp"
#include "types/TrashedItem.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace trashy::engine {

struct PurgeSelector {
    enum class Kind { Item, Filter, All };

    Kind kind = Kind::All;
    std::optional<types::TrashedItem> item;
    ListFilter filter;

    static PurgeSelector of(types::TrashedItem item);
    static PurgeSelector matching(ListFilter filter);
    static PurgeSelector everything();
};

// Return false to stop the scan
using ItemVisitor = std::function<bool(const types::TrashedItem&)>;

/**
 * Public operations over every trash store reachable through the context.
 * All failures surface as types::Error carrying an ErrorCode.
 */
class Engine {
public:
    explicit Engine(std::shared_ptr<Context> ctx);

    // Moves `path` into the trash of its volume. The entry is either fully trashed or left in place.
    types::TrashedItem put(const std::filesystem::path& path);

    // Committed items of every known store, filtered and sorted
    std::vector<types::TrashedItem> list(const ListFilter& filter = {}, const store::IssueHandler& onIssue = {});

    // Streams matching items without materializing them; order and limit-after-sort do not apply.
    // Returns the number of items visited.
    size_t scan(const ListFilter& filter, const ItemVisitor& visitor, const store::IssueHandler& onIssue = {});

    // Moves the payload back to its original path (or `destination`) and drops the record.
    // Never overwrites an existing entry.
    std::filesystem::path restore(const types::TrashedItem& item,
                                  const std::optional<std::filesystem::path>& destination = std::nullopt);

    // Permanently deletes the selected items. Bulk purges without a constraint require `confirmed`.
    size_t purge(const PurgeSelector& selector, bool confirmed = false);

    // Purges items older than trash.retention_days; a no-op when retention is 0
    size_t purgeExpired();

    // Everything a scan would skip: pending, corrupt and orphaned entries
    std::vector<store::ScanIssue> check();

    [[nodiscard]] const std::shared_ptr<Context>& context() const { return ctx_; }

private:
    std::shared_ptr<Context> ctx_;

    std::vector<store::Store> stores();
    types::TrashedItem commitWithFreeName(const store::Store& store, const std::filesystem::path& source,
                                          const std::filesystem::path& originalPath);
    size_t purgeItems(const std::vector<types::TrashedItem>& items);
    void moveBack(const types::TrashedItem& item, const std::filesystem::path& target);
};

}
