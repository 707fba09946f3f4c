#pragma once

#include "types/TrashedItem.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trashy::store {

// Claim on an entry name: an empty (pending) metadata record created with O_EXCL
struct Reservation {
    std::string name;
    std::filesystem::path info_path;
    std::filesystem::path payload_path;
};

enum class IssueKind {
    Pending,            // reserved but never committed
    Corrupt,            // record present but unparsable
    OrphanedMetadata,   // record without payload
    OrphanedPayload,    // payload without record
    Vanished,           // removed by another process between directory scan and read
    IncompleteRestore   // hidden copy left beside an original path by an interrupted restore
};

const char* to_string(IssueKind kind);

struct ScanIssue {
    IssueKind kind;
    std::string name;
    std::filesystem::path path;
    std::string detail;
};

using IssueHandler = std::function<void(const ScanIssue&)>;

/**
 * One trash directory: payloads under files/, restore metadata under info/, and
 * expunged/ as the staging area for purges. Every primitive is a single atomic
 * filesystem operation or is ordered so an interruption leaves either a pending
 * record or an orphan, both of which list() skips.
 */
class Store {
public:
    static constexpr const auto* FILES_DIR = "files";
    static constexpr const auto* INFO_DIR = "info";
    static constexpr const auto* EXPUNGED_DIR = "expunged";

    // Pending and temporary records younger than this may still belong to a put in flight
    static constexpr std::chrono::seconds LEFTOVER_GRACE{600};

    class Scan;

    explicit Store(std::filesystem::path root, std::filesystem::path topdir = {});

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] const std::filesystem::path& topdir() const { return topdir_; }
    [[nodiscard]] std::filesystem::path filesDir() const { return root_ / FILES_DIR; }
    [[nodiscard]] std::filesystem::path infoDir() const { return root_ / INFO_DIR; }
    [[nodiscard]] std::filesystem::path expungedDir() const { return root_ / EXPUNGED_DIR; }
    [[nodiscard]] std::filesystem::path payloadPath(const std::string& name) const;
    [[nodiscard]] std::filesystem::path infoPath(const std::string& name) const;

    [[nodiscard]] bool exists() const;
    void ensureLayout() const;

    // True if either a payload or a record (pending or committed) uses `name`
    [[nodiscard]] bool isOccupied(const std::string& name) const;

    // Throws types::Error(NameTaken) when the record or an orphaned payload already exists
    [[nodiscard]] Reservation reserve(const std::string& name) const;

    // Moves `source` into files/, then atomically replaces the pending record with the full one.
    // On failure everything is rolled back and types::Error is thrown.
    types::TrashedItem commit(const Reservation& res, const std::filesystem::path& source,
                              const std::filesystem::path& originalPath, std::time_t deletedAt) const;

    // Drops an uncommitted reservation; returns false if the record could not be removed
    bool abandon(const Reservation& res) const;

    // Lazy scan of committed, restorable items. Iterating again rescans the directory.
    [[nodiscard]] Scan list(IssueHandler onIssue = {}) const;

    // Reads a single item; problems are reported through `onIssue` and yield nullopt
    std::optional<types::TrashedItem> load(const std::string& name, const IssueHandler& onIssue = {}) const;

    // On-disk payload and record locations of `item`; deletes nothing
    [[nodiscard]] std::pair<std::filesystem::path, std::filesystem::path> release(const types::TrashedItem& item) const;

    // Permanently deletes payload and record
    void remove(const types::TrashedItem& item) const;

    // Deletes a record whose payload is already gone (restore, orphan cleanup)
    void removeRecord(const types::TrashedItem& item) const;

    [[nodiscard]] std::vector<ScanIssue> orphanedPayloads() const;

    // Removes leftovers of interrupted purges; returns the number of entries removed
    size_t sweepExpunged() const;

    // Deletes what a scan reports as broken: orphaned payloads and records, plus pending,
    // corrupt and temporary records (with any payload) untouched for at least `grace`.
    // Failures are logged and skipped; returns the number of entries removed.
    size_t removeLeftovers(std::chrono::seconds grace = LEFTOVER_GRACE) const;

private:
    std::filesystem::path root_;
    std::filesystem::path topdir_;

    // Renames a payload into expunged/; throws types::Error when it cannot be moved
    std::filesystem::path stage(const std::filesystem::path& payload, const std::string& name) const;
    bool discardPayload(const std::string& name) const;

    void report(const IssueHandler& onIssue, ScanIssue issue) const;
};

class Store::Scan {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = types::TrashedItem;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) { return !a.current_ && !b.current_; }

    private:
        friend class Scan;
        explicit iterator(const Scan* scan);
        void advance();

        const Scan* scan_ = nullptr;
        std::filesystem::directory_iterator dir_;
        std::optional<types::TrashedItem> current_;
    };

    [[nodiscard]] iterator begin() const { return iterator(this); }
    [[nodiscard]] iterator end() const { return {}; }

    [[nodiscard]] const Store& store() const { return store_; }

private:
    friend class Store;
    Scan(Store store, IssueHandler onIssue);

    Store store_;
    IssueHandler onIssue_;
};

}
