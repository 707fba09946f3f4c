#include "volume/Resolver.hpp"
#include "types/Error.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <set>
#include <sys/stat.h>
#include <unistd.h>

using namespace trashy::volume;
using namespace trashy::types;
using trashy::log::Registry;

namespace fs = std::filesystem;

static std::optional<struct stat> lstatPath(const fs::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) return std::nullopt;
    return st;
}

Resolver::Resolver(ResolverOptions opts) : opts_(std::move(opts)) {
    if (opts_.home_trash.empty())
        throw std::invalid_argument("Resolver: home_trash is empty.");
    opts_.home_trash = util::makeAbsolute(opts_.home_trash);
}

const MountTable& Resolver::mounts() {
    if (!mounts_) {
        try {
            mounts_ = MountTable::load(opts_.mount_table);
        } catch (const std::exception& e) {
            // Ancestry walking still finds mount roots without the table
            Registry::volume()->warn("[Resolver] {}", e.what());
            mounts_ = MountTable();
        }
    }
    return *mounts_;
}

dev_t Resolver::homeDevice() {
    std::scoped_lock lk(mutex_);
    return homeDeviceLocked();
}

dev_t Resolver::homeDeviceLocked() {
    if (homeDevice_) return *homeDevice_;

    // The home trash may not exist yet; its first existing ancestor lives on the same device
    auto probe = opts_.home_trash;
    while (true) {
        if (const auto st = lstatPath(probe)) {
            homeDevice_ = st->st_dev;
            return *homeDevice_;
        }
        if (!probe.has_parent_path() || probe.parent_path() == probe) break;
        probe = probe.parent_path();
    }
    throw Error(ErrorCode::UnresolvableVolume, "Cannot stat home trash or any of its ancestors", opts_.home_trash);
}

Resolution Resolver::resolve(const fs::path& absPath) {
    const auto st = lstatPath(absPath);
    if (!st) {
        const int err = errno;
        throw Error(ErrorCode::UnresolvableVolume,
                    "Cannot resolve volume for '" + absPath.string() + "': " + std::strerror(err), absPath);
    }

    std::scoped_lock lk(mutex_);
    if (const auto it = cache_.find(st->st_dev); it != cache_.end()) return it->second;

    Resolution res;
    if (st->st_dev == homeDeviceLocked()) {
        res.volume = findVolume(opts_.home_trash.parent_path(), st->st_dev);
        res.store_root = opts_.home_trash;
        res.is_home = true;
    } else {
        if (!opts_.use_topdir_trash)
            throw Error(ErrorCode::UnresolvableVolume,
                        "'" + absPath.string() + "' is not on the home trash filesystem and per-volume trash is disabled",
                        absPath);

        res.volume = findVolume(absPath, st->st_dev);
        const auto store = topdirStore(res.volume.mount_point, true);
        if (!store)
            throw Error(ErrorCode::UnresolvableVolume,
                        "No usable trash directory on volume mounted at " + res.volume.mount_point.string(), absPath);
        res.store_root = *store;
        res.topdir = res.volume.mount_point;
    }

    Registry::volume()->debug("[Resolver] {} -> volume {} ({}), store {}", absPath.string(),
                              res.volume.mount_point.string(), res.volume.fs_type, res.store_root.string());

    cache_.emplace(st->st_dev, res);
    return res;
}

Volume Resolver::findVolume(const fs::path& absPath, const dev_t dev) {
    Volume v;
    v.device = dev;

    const auto canonical = util::canonicalParent(absPath);
    if (const auto entry = mounts().longestPrefix(canonical)) {
        if (const auto mst = lstatPath(entry->mount_point); mst && mst->st_dev == dev) {
            v.mount_point = entry->mount_point;
            v.source = entry->source;
            v.fs_type = entry->fs_type;
            return v;
        }
    }

    // Bind mounts, namespaces or a missing table: fall back to walking up while the device stays the same
    v.mount_point = mountRootByAncestry(canonical, dev);
    for (const auto& e : mounts().entries())
        if (e.mount_point == v.mount_point) {
            v.source = e.source;
            v.fs_type = e.fs_type;
        }
    return v;
}

fs::path Resolver::mountRootByAncestry(const fs::path& start, const dev_t dev) {
    auto current = start;
    while (!lstatPath(current) && current.has_parent_path() && current.parent_path() != current)
        current = current.parent_path();

    while (current.has_parent_path() && current.parent_path() != current) {
        const auto parent = current.parent_path();
        const auto st = lstatPath(parent);
        if (!st || st->st_dev != dev) break;
        current = parent;
    }
    return current;
}

bool Resolver::isUsableStoreDir(const fs::path& dir) const {
    const auto st = lstatPath(dir);
    return st
        && S_ISDIR(st->st_mode)          // real directory, lstat so symlinks fail here
        && st->st_uid == opts_.uid
        && (st->st_mode & 0777) == 0700;
}

bool Resolver::initStoreDir(const fs::path& dir) const {
    if (::mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST) {
        Registry::volume()->debug("[Resolver] mkdir {} failed: {}", dir.string(), std::strerror(errno));
        return false;
    }
    // On e.g. vfat volumes the directory is not owned by the user and cannot be used
    return isUsableStoreDir(dir);
}

std::optional<fs::path> Resolver::topdirStore(const fs::path& top, const bool create) const {
    const auto uid = std::to_string(opts_.uid);

    // (1) Administrator-created $top/.Trash: root-owned, sticky, writable by others
    const auto adminDir = top / ".Trash";
    if (const auto st = lstatPath(adminDir)) {
        constexpr unsigned int requiredBits = S_IWOTH | S_IXOTH | S_ISVTX;
        if (st->st_uid == 0 && S_ISDIR(st->st_mode) && (st->st_mode & requiredBits) == requiredBits) {
            const auto dir = adminDir / uid;
            if (isUsableStoreDir(dir)) return dir;
            if (!lstatPath(dir) && create && initStoreDir(dir)) return dir;
            Registry::volume()->debug("[Resolver] {} failed the security checks", dir.string());
        } else {
            Registry::volume()->debug("[Resolver] {} exists but failed the security checks", adminDir.string());
        }
    }

    // (2) $top/.Trash-$uid
    const auto dir = top / (".Trash-" + uid);
    if (lstatPath(dir)) {
        if (isUsableStoreDir(dir)) return dir;
        Registry::volume()->warn("[Resolver] {} exists but failed the security checks, not using it", dir.string());
        return std::nullopt;
    }
    if (create && initStoreDir(dir)) return dir;
    return std::nullopt;
}

std::vector<Resolution> Resolver::knownStores() {
    std::scoped_lock lk(mutex_);

    std::vector<Resolution> out;
    std::set<fs::path> seen;
    const auto add = [&](Resolution r) {
        if (seen.insert(r.store_root).second) out.push_back(std::move(r));
    };

    std::error_code ec;
    if (fs::is_directory(opts_.home_trash, ec)) {
        Resolution home;
        home.store_root = opts_.home_trash;
        home.is_home = true;
        home.volume = findVolume(opts_.home_trash.parent_path(), homeDeviceLocked());
        add(std::move(home));
    }

    for (const auto& [dev, res] : cache_) add(res);

    if (!opts_.use_topdir_trash) return out;

    const auto homeDev = homeDeviceLocked();
    for (const auto& e : mounts().entries()) {
        if (MountTable::isPseudoFs(e.fs_type)) continue;
        const auto st = lstatPath(e.mount_point);
        if (!st || st->st_dev == homeDev) continue;

        const auto store = topdirStore(e.mount_point, false);
        if (!store) continue;

        Resolution r;
        r.volume = {st->st_dev, e.mount_point, e.source, e.fs_type};
        r.store_root = *store;
        r.topdir = e.mount_point;
        add(std::move(r));
    }

    return out;
}
