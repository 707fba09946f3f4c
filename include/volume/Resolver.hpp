#pragma once

#include "volume/MountTable.hpp"
#include "volume/Volume.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <sys/types.h>

namespace trashy::volume {

struct ResolverOptions {
    std::filesystem::path home_trash;   // store used for every path on the home device
    bool use_topdir_trash = true;
    std::filesystem::path mount_table = MountTable::DEFAULT_SOURCE;
    uid_t uid{};
};

struct Resolution {
    Volume volume;
    std::filesystem::path store_root;
    std::filesystem::path topdir;       // mount point a topdir store belongs to; empty for the home store
    bool is_home = false;
};

/**
 * Maps paths to the volume that holds them and to that volume's trash store.
 *
 * Paths on the device of the home trash use the home trash. Any other volume uses a
 * store at its mount point ($top/.Trash/$uid when an administrator prepared a sticky
 * $top/.Trash, otherwise $top/.Trash-$uid), so payload moves never cross filesystems.
 * Results are cached per device for the lifetime of the resolver.
 */
class Resolver {
public:
    explicit Resolver(ResolverOptions opts);

    // Throws types::Error(UnresolvableVolume) when `absPath` is missing or no usable store exists
    Resolution resolve(const std::filesystem::path& absPath);

    // Stores that already exist on disk; never creates anything
    std::vector<Resolution> knownStores();

    dev_t homeDevice();

    // Directory checks applied to per-volume stores: owned by uid, real directory, mode 0700
    [[nodiscard]] bool isUsableStoreDir(const std::filesystem::path& dir) const;

private:
    ResolverOptions opts_;

    std::mutex mutex_;
    std::unordered_map<dev_t, Resolution> cache_;
    std::optional<MountTable> mounts_;
    std::optional<dev_t> homeDevice_;

    const MountTable& mounts();
    dev_t homeDeviceLocked();
    Volume findVolume(const std::filesystem::path& absPath, dev_t dev);
    static std::filesystem::path mountRootByAncestry(const std::filesystem::path& start, dev_t dev);
    std::optional<std::filesystem::path> topdirStore(const std::filesystem::path& top, bool create) const;
    bool initStoreDir(const std::filesystem::path& dir) const;
};

}
