#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace trashy::store {

static constexpr const auto* TRASH_INFO_EXT = ".trashinfo";
static constexpr const auto* TRASH_INFO_HEADER = "[Trash Info]";

/**
 * Restore metadata for one trashed item, stored as a key-value text record:
 *
 *   [Trash Info]
 *   Path=/data/report%20final.txt
 *   DeletionDate=2024-05-01T13:37:00
 *
 * Path is percent-encoded; DeletionDate is local time without zone.
 */
struct TrashInfo {
    std::filesystem::path original_path;
    std::time_t deleted_at{};

    [[nodiscard]] std::string serialize() const;

    // Throws types::Error(Corrupt). A relative Path is resolved against `topdir`.
    static TrashInfo parse(const std::string& text, const std::filesystem::path& topdir = {});

    bool operator==(const TrashInfo&) const = default;
};

}
