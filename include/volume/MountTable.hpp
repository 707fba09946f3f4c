#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trashy::volume {

struct MountEntry {
    std::filesystem::path mount_point;
    std::string source;
    std::string fs_type;
};

class MountTable {
public:
    static constexpr const auto* DEFAULT_SOURCE = "/proc/self/mounts";

    MountTable() = default;
    explicit MountTable(std::vector<MountEntry> entries);

    // Reads an fstab(5)-format table; throws std::runtime_error if it cannot be opened
    static MountTable load(const std::filesystem::path& source = DEFAULT_SOURCE);

    // Mount whose mount point is the longest prefix of `absPath`; later entries shadow earlier ones
    [[nodiscard]] std::optional<MountEntry> longestPrefix(const std::filesystem::path& absPath) const;

    [[nodiscard]] const std::vector<MountEntry>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    // Kernel pseudo filesystems never hold user files worth trashing
    static bool isPseudoFs(const std::string& fsType);

private:
    std::vector<MountEntry> entries_;
};

}
