#include "volume/MountTable.hpp"
#include "util/fsPath.hpp"

#include <mntent.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

using namespace trashy::volume;

MountTable::MountTable(std::vector<MountEntry> entries) : entries_(std::move(entries)) {}

MountTable MountTable::load(const std::filesystem::path& source) {
    // getmntent decodes the \040-style escapes used for spaces in mount points
    FILE* f = ::setmntent(source.c_str(), "r");
    if (!f) throw std::runtime_error("Cannot read mount table " + source.string() + ": " + std::strerror(errno));

    std::vector<MountEntry> entries;
    mntent ent{};
    char buf[4096];
    while (::getmntent_r(f, &ent, buf, sizeof(buf))) {
        if (!ent.mnt_dir || ent.mnt_dir[0] != '/') continue;
        entries.push_back({ent.mnt_dir, ent.mnt_fsname ? ent.mnt_fsname : "", ent.mnt_type ? ent.mnt_type : ""});
    }
    ::endmntent(f);

    return MountTable(std::move(entries));
}

std::optional<MountEntry> MountTable::longestPrefix(const std::filesystem::path& absPath) const {
    std::optional<MountEntry> best;
    size_t bestLen = 0;
    for (const auto& e : entries_) {
        if (!util::isSameOrWithin(absPath, e.mount_point)) continue;
        const auto len = e.mount_point.lexically_normal().string().size();
        if (!best || len >= bestLen) {
            best = e;
            bestLen = len;
        }
    }
    return best;
}

bool MountTable::isPseudoFs(const std::string& fsType) {
    static const std::unordered_set<std::string> pseudo = {
        "proc", "sysfs", "devtmpfs", "devpts", "cgroup", "cgroup2", "securityfs", "debugfs",
        "tracefs", "pstore", "bpf", "mqueue", "hugetlbfs", "configfs", "fusectl", "binfmt_misc",
        "autofs", "efivarfs", "nsfs", "rpc_pipefs", "selinuxfs"
    };
    return pseudo.contains(fsType);
}
