#include "io/Transfer.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <fmt/format.h>
#include <fcntl.h>
#include <unistd.h>

using namespace trashy::types;
using trashy::log::Registry;

namespace fs = std::filesystem;

namespace trashy::io {

int moveNoReplace(const fs::path& from, const fs::path& to) {
#ifdef RENAME_NOREPLACE
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) return 0;
    if (errno != EINVAL && errno != ENOSYS) return errno;
#endif
    // Filesystem without RENAME_NOREPLACE: check, then rename
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec))) return EEXIST;
    if (::rename(from.c_str(), to.c_str()) == 0) return 0;
    return errno;
}

TreeStats treeStats(const fs::path& root) {
    TreeStats stats;
    const auto st = fs::symlink_status(root);
    if (!fs::exists(st)) throw fs::filesystem_error("treeStats", root, std::make_error_code(std::errc::no_such_file_or_directory));

    ++stats.entries;
    if (fs::is_regular_file(st)) {
        stats.bytes += fs::file_size(root);
        return stats;
    }
    if (!fs::is_directory(st)) return stats;

    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        ++stats.entries;
        if (it->is_regular_file() && !it->is_symlink()) stats.bytes += it->file_size();
    }
    return stats;
}

static constexpr const auto* STAGING_MARKER = ".trashy-restore.";

fs::path stagingPathFor(const fs::path& to) {
    return to.parent_path() / ("." + to.filename().string() + STAGING_MARKER + std::to_string(::getpid()));
}

bool isStagingPathFor(const fs::path& candidate, const fs::path& to) {
    if (candidate.parent_path() != to.parent_path()) return false;
    const auto name = candidate.filename().string();
    const auto prefix = "." + to.filename().string() + STAGING_MARKER;
    if (name.size() <= prefix.size() || !name.starts_with(prefix)) return false;
    return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()), name.end(),
                       [](const unsigned char c) { return std::isdigit(c) != 0; });
}

static void copyEntry(const fs::path& from, const fs::path& to) {
    const auto st = fs::symlink_status(from);

    if (fs::is_symlink(st)) {
        fs::copy_symlink(from, to);
        return;
    }

    if (fs::is_directory(st)) {
        fs::create_directory(to);
        for (const auto& child : fs::directory_iterator(from))
            copyEntry(child.path(), to / child.path().filename());
        fs::permissions(to, st.permissions());
        fs::last_write_time(to, fs::last_write_time(from)); // after children, which touch the directory
        return;
    }

    if (fs::is_regular_file(st)) {
        fs::copy_file(from, to, fs::copy_options::none);
        fs::permissions(to, st.permissions());
        fs::last_write_time(to, fs::last_write_time(from));
        return;
    }

    throw Error(ErrorCode::MoveFailed, "Unsupported file type for cross-device copy: " + from.string(), from);
}

bool crossDeviceMove(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec)))
        throw Error(ErrorCode::DestinationExists, "Destination already exists: " + to.string(), to);

    const auto staging = stagingPathFor(to);
    fs::remove_all(staging, ec); // leftover from an interrupted run of a process with our pid

    const auto discardStaging = [&] {
        std::error_code rmEc;
        fs::remove_all(staging, rmEc);
        if (rmEc) Registry::engine()->error("[Transfer] Failed to remove partial copy {}: {}", staging.string(), rmEc.message());
    };

    try {
        copyEntry(from, staging);
        const auto src = treeStats(from);
        const auto dst = treeStats(staging);
        if (!(src == dst))
            throw Error(ErrorCode::MoveFailed,
                        fmt::format("Copy verification failed for {} ({} entries/{} bytes vs {} entries/{} bytes)",
                                    from.string(), src.entries, src.bytes, dst.entries, dst.bytes), from);
    } catch (const Error&) {
        discardStaging();
        throw;
    } catch (const fs::filesystem_error& e) {
        discardStaging();
        throw Error(ErrorCode::MoveFailed, std::string("Cross-device copy failed: ") + e.what(), from);
    }

    if (const int err = moveNoReplace(staging, to); err != 0) {
        discardStaging();
        if (err == EEXIST || err == ENOTEMPTY)
            throw Error(ErrorCode::DestinationExists, "Destination appeared during copy: " + to.string(), to);
        throw Error::fromErrno(err, "Cannot move copy into place", to);
    }

    fs::remove_all(from, ec);
    if (ec) {
        Registry::engine()->warn("[Transfer] Copied {} to {} but could not remove the source: {}",
                                 from.string(), to.string(), ec.message());
        return false;
    }
    return true;
}

}
