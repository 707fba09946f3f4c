#include "store/Store.hpp"
#include "store/TrashInfo.hpp"
#include "types/Error.hpp"
#include "io/Transfer.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace trashy::store;
using namespace trashy::types;
using trashy::log::Registry;

namespace fs = std::filesystem;

const char* trashy::store::to_string(const IssueKind kind) {
    switch (kind) {
        case IssueKind::Pending: return "pending";
        case IssueKind::Corrupt: return "corrupt";
        case IssueKind::OrphanedMetadata: return "orphaned-metadata";
        case IssueKind::OrphanedPayload: return "orphaned-payload";
        case IssueKind::Vanished: return "vanished";
        case IssueKind::IncompleteRestore: return "incomplete-restore";
    }
    return "?";
}

static bool entryExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

static std::optional<std::time_t> modifiedAt(const fs::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) return std::nullopt;
    return st.st_mtime;
}

static bool hasInfoExtension(const std::string& filename) {
    const std::string ext = TRASH_INFO_EXT;
    return filename.size() > ext.size() && filename.ends_with(ext);
}

static void validateName(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        throw Error(ErrorCode::InvalidPath, "Invalid trash entry name: '" + name + "'");
}

Store::Store(fs::path root, fs::path topdir) : root_(std::move(root)), topdir_(std::move(topdir)) {}

fs::path Store::payloadPath(const std::string& name) const { return filesDir() / name; }

fs::path Store::infoPath(const std::string& name) const { return infoDir() / (name + TRASH_INFO_EXT); }

bool Store::exists() const {
    std::error_code ec;
    return fs::is_directory(infoDir(), ec) && fs::is_directory(filesDir(), ec);
}

void Store::ensureLayout() const {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        fs::create_directories(root_.parent_path(), ec);
        if (ec) throw Error::fromErrno(ec.value(), "Cannot create parent of trash directory", root_, ErrorCode::UnresolvableVolume);
    }

    for (const auto& dir : {root_, filesDir(), infoDir()}) {
        if (::mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST)
            throw Error::fromErrno(errno, "Cannot create trash directory", dir, ErrorCode::UnresolvableVolume);
        if (!fs::is_directory(dir, ec))
            throw Error(ErrorCode::UnresolvableVolume, "Trash path is not a directory: " + dir.string(), dir);
    }
}

bool Store::isOccupied(const std::string& name) const {
    return entryExists(payloadPath(name)) || entryExists(infoPath(name));
}

Reservation Store::reserve(const std::string& name) const {
    validateName(name);

    Reservation res{name, infoPath(name), payloadPath(name)};

    // The O_EXCL create is the only authority on name ownership across processes
    const int fd = ::open(res.info_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        if (errno == EEXIST) throw Error(ErrorCode::NameTaken, "Trash entry name taken: " + name, res.info_path);
        throw Error::fromErrno(errno, "Cannot reserve trash entry", res.info_path);
    }
    ::close(fd);

    if (entryExists(res.payload_path)) {
        // Orphaned payload from an interrupted operation still owns this name
        abandon(res);
        throw Error(ErrorCode::NameTaken, "Trash entry name occupied by an orphaned payload: " + name, res.payload_path);
    }

    Registry::store()->debug("[Store] Reserved {}", res.info_path.string());
    return res;
}

bool Store::abandon(const Reservation& res) const {
    if (::unlink(res.info_path.c_str()) != 0 && errno != ENOENT) {
        Registry::store()->error("[Store] Failed to drop reservation {}: {}", res.info_path.string(), std::strerror(errno));
        return false;
    }
    return true;
}

TrashedItem Store::commit(const Reservation& res, const fs::path& source, const fs::path& originalPath,
                          const std::time_t deletedAt) const {
    if (const int err = io::moveNoReplace(source, res.payload_path); err != 0) {
        abandon(res);
        if (err == EEXIST || err == ENOTEMPTY)
            throw Error(ErrorCode::NameTaken, "Payload slot taken for " + res.name, res.payload_path);
        if (err == EXDEV)
            throw Error(ErrorCode::MoveFailed, "Trash directory is on another filesystem than " + source.string(), source);
        throw Error::fromErrno(err, "Cannot move to trash", source);
    }

    // Point of no return for the payload: from here a failure must move it back
    const TrashInfo info{originalPath, deletedAt};
    const auto tmp = infoDir() / (res.name + TRASH_INFO_EXT + ".tmp." + std::to_string(::getpid()));

    int err = util::writeFileDurable(tmp, info.serialize());
    if (err == 0 && ::rename(tmp.c_str(), res.info_path.c_str()) != 0) err = errno;

    if (err != 0) {
        (void)::unlink(tmp.c_str());

        // The reservation is ours: writing it in place still leaves a listable item
        if (util::writeFileDurable(res.info_path, info.serialize()) == 0) {
            Registry::store()->warn("[Store] Wrote record {} in place after {}: {}", res.info_path.string(),
                                    tmp.string(), std::strerror(err));
            return TrashedItem{res.name, originalPath, deletedAt, res.payload_path, res.info_path, root_};
        }

        if (const int back = io::moveNoReplace(res.payload_path, source); back != 0) {
            Registry::store()->error("[Store] Could not write record for {} and could not move it back to {}: {}",
                                     res.payload_path.string(), source.string(), std::strerror(back));
        } else {
            abandon(res);
        }
        throw Error::fromErrno(err, "Cannot write trash record", res.info_path);
    }

    if (const int syncErr = util::fsyncDir(infoDir()); syncErr != 0)
        Registry::store()->debug("[Store] fsync of {} failed: {}", infoDir().string(), std::strerror(syncErr));

    return TrashedItem{res.name, originalPath, deletedAt, res.payload_path, res.info_path, root_};
}

Store::Scan Store::list(IssueHandler onIssue) const {
    return {*this, std::move(onIssue)};
}

void Store::report(const IssueHandler& onIssue, ScanIssue issue) const {
    if (issue.kind == IssueKind::Vanished)
        Registry::store()->debug("[Store] {} {}: {}", to_string(issue.kind), issue.path.string(), issue.detail);
    else
        Registry::store()->warn("[Store] Skipping {} entry {}: {}", to_string(issue.kind), issue.path.string(), issue.detail);
    if (onIssue) onIssue(issue);
}

std::optional<TrashedItem> Store::load(const std::string& name, const IssueHandler& onIssue) const {
    const auto info = infoPath(name);
    const auto payload = payloadPath(name);

    std::string text;
    try {
        text = util::readFileToString(info);
    } catch (const std::exception& e) {
        if (!entryExists(info)) report(onIssue, {IssueKind::Vanished, name, info, "record disappeared"});
        else report(onIssue, {IssueKind::Corrupt, name, info, e.what()});
        return std::nullopt;
    }

    if (text.empty()) {
        report(onIssue, {IssueKind::Pending, name, info, "reserved but never committed"});
        return std::nullopt;
    }

    TrashInfo parsed;
    try {
        parsed = TrashInfo::parse(text, topdir_);
    } catch (const Error& e) {
        report(onIssue, {IssueKind::Corrupt, name, info, e.what()});
        return std::nullopt;
    }

    if (!entryExists(payload)) {
        report(onIssue, {IssueKind::OrphanedMetadata, name, info, "payload missing"});
        return std::nullopt;
    }

    return TrashedItem{name, parsed.original_path, parsed.deleted_at, payload, info, root_};
}

std::pair<fs::path, fs::path> Store::release(const TrashedItem& item) const {
    return {payloadPath(item.id), infoPath(item.id)};
}

void Store::removeRecord(const TrashedItem& item) const {
    const auto info = infoPath(item.id);
    if (::unlink(info.c_str()) != 0 && errno != ENOENT)
        throw Error::fromErrno(errno, "Cannot delete trash record", info);
}

void Store::remove(const TrashedItem& item) const {
    const auto [payload, info] = release(item);

    if (!entryExists(payload)) {
        // Nothing left to stage; dropping the record finishes the job
        removeRecord(item);
        Registry::store()->info("[Store] Removed orphaned record {}", info.string());
        return;
    }

    // Stage first: once the record is gone nothing can present a half-deleted payload as restorable
    const auto staged = stage(payload, item.id);

    if (::unlink(info.c_str()) != 0 && errno != ENOENT) {
        const int unlinkErr = errno;
        if (io::moveNoReplace(staged, payload) != 0)
            Registry::store()->error("[Store] Could not put back staged payload {} for {}", staged.string(), info.string());
        throw Error::fromErrno(unlinkErr, "Cannot delete trash record", info);
    }

    std::error_code ec;
    fs::remove_all(staged, ec);
    if (ec) Registry::store()->warn("[Store] Left staged payload {} for a later sweep: {}", staged.string(), ec.message());

    Registry::store()->debug("[Store] Removed {}", item.id);
}

fs::path Store::stage(const fs::path& payload, const std::string& name) const {
    if (::mkdir(expungedDir().c_str(), 0700) != 0 && errno != EEXIST)
        throw Error::fromErrno(errno, "Cannot create expunge directory", expungedDir());

    fs::path staged;
    int err = 0;
    for (unsigned int i = 0; i < 100; ++i) {
        staged = expungedDir() / (name + "." + std::to_string(::getpid()) + (i ? "." + std::to_string(i) : ""));
        err = io::moveNoReplace(payload, staged);
        if (err != EEXIST && err != ENOTEMPTY) break;
    }
    if (err != 0) throw Error::fromErrno(err, "Cannot stage payload for deletion", payload);
    return staged;
}

bool Store::discardPayload(const std::string& name) const {
    const auto payload = payloadPath(name);
    if (!entryExists(payload)) return false;

    const auto staged = stage(payload, name);
    std::error_code ec;
    fs::remove_all(staged, ec);
    if (ec) Registry::store()->warn("[Store] Left staged payload {} for a later sweep: {}", staged.string(), ec.message());
    return true;
}

size_t Store::removeLeftovers(const std::chrono::seconds grace) const {
    const auto cutoff = util::now() - static_cast<std::time_t>(grace.count());
    const auto stale = [&](const fs::path& p) {
        const auto mtime = modifiedAt(p);
        return mtime && *mtime <= cutoff;
    };

    size_t removed = 0;
    const auto drop = [&](const fs::path& p) {
        if (::unlink(p.c_str()) == 0) {
            ++removed;
            Registry::store()->info("[Store] Removed leftover {}", p.string());
        } else if (errno != ENOENT) {
            Registry::store()->warn("[Store] Could not remove leftover {}: {}", p.string(), std::strerror(errno));
        }
    };
    const auto discard = [&](const std::string& name) {
        try {
            if (discardPayload(name)) ++removed;
            return true;
        } catch (const Error& e) {
            Registry::store()->warn("[Store] Could not remove leftover payload {}: {}", name, e.what());
            return false;
        }
    };

    std::vector<ScanIssue> broken;
    for ([[maybe_unused]] const auto& item : list([&](const ScanIssue& issue) { broken.push_back(issue); })) {}

    for (const auto& issue : broken) {
        switch (issue.kind) {
        case IssueKind::Pending:
        case IssueKind::Corrupt:
            if (stale(issue.path) && discard(issue.name)) drop(issue.path);
            break;
        case IssueKind::OrphanedMetadata:
            drop(issue.path);
            break;
        case IssueKind::OrphanedPayload:
        case IssueKind::Vanished:
        case IssueKind::IncompleteRestore:
            break;
        }
    }

    for (const auto& orphan : orphanedPayloads()) discard(orphan.name);

    const std::string tmpMarker = std::string(TRASH_INFO_EXT) + ".tmp.";
    std::vector<fs::path> temps;
    std::error_code ec;
    for (fs::directory_iterator it(infoDir(), ec), end; !ec && it != end; it.increment(ec))
        if (it->path().filename().string().find(tmpMarker) != std::string::npos && stale(it->path()))
            temps.push_back(it->path());
    for (const auto& t : temps) drop(t);

    return removed + sweepExpunged();
}

std::vector<ScanIssue> Store::orphanedPayloads() const {
    std::vector<ScanIssue> out;
    std::error_code ec;
    for (fs::directory_iterator it(filesDir(), ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!entryExists(infoPath(name)))
            out.push_back({IssueKind::OrphanedPayload, name, it->path(), "payload without record"});
    }
    return out;
}

size_t Store::sweepExpunged() const {
    size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(expungedDir(), ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code rmEc;
        fs::remove_all(it->path(), rmEc);
        if (rmEc) Registry::store()->warn("[Store] Could not sweep {}: {}", it->path().string(), rmEc.message());
        else ++removed;
    }
    return removed;
}

// ===== Scan =====

Store::Scan::Scan(Store store, IssueHandler onIssue) : store_(std::move(store)), onIssue_(std::move(onIssue)) {}

Store::Scan::iterator::iterator(const Scan* scan) : scan_(scan) {
    std::error_code ec;
    dir_ = fs::directory_iterator(scan_->store_.infoDir(), ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory)
            Registry::store()->warn("[Store] Cannot scan {}: {}", scan_->store_.infoDir().string(), ec.message());
        dir_ = fs::directory_iterator();
        return;
    }
    advance();
}

void Store::Scan::iterator::advance() {
    current_.reset();
    while (dir_ != fs::directory_iterator()) {
        const auto filename = dir_->path().filename().string();

        std::error_code ec;
        dir_.increment(ec);
        if (ec) {
            Registry::store()->warn("[Store] Directory scan of {} aborted: {}", scan_->store_.infoDir().string(), ec.message());
            dir_ = fs::directory_iterator();
        }

        if (!hasInfoExtension(filename)) continue; // in-flight .tmp records and foreign files

        const auto name = filename.substr(0, filename.size() - std::strlen(TRASH_INFO_EXT));
        if (auto item = scan_->store_.load(name, scan_->onIssue_)) {
            current_ = std::move(item);
            return;
        }
    }
}
