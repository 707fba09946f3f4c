#pragma once

#include <cstdint>
#include <filesystem>

namespace trashy::io {

// rename(2) that never replaces an existing target; returns 0 or an errno value
int moveNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

struct TreeStats {
    uintmax_t entries = 0;  // files, directories and symlinks, the root included
    uintmax_t bytes = 0;    // sum of regular file sizes

    bool operator==(const TreeStats&) const = default;
};

// Does not follow symlinks; throws std::filesystem::filesystem_error
TreeStats treeStats(const std::filesystem::path& root);

/**
 * Moves `from` to `to` across filesystems.
 *
 * The tree is copied to a hidden sibling of `to`, with permissions and modification
 * times preserved, and compared against the source by entry count and byte total.
 * Only a verified copy is renamed into place, and only after that is the source
 * removed. A failure before the final rename deletes the partial copy and leaves
 * `from` untouched.
 *
 * Throws types::Error (DestinationExists, MoveFailed). Returns false when the copy
 * landed but the source could not be fully removed.
 */
bool crossDeviceMove(const std::filesystem::path& from, const std::filesystem::path& to);

std::filesystem::path stagingPathFor(const std::filesystem::path& to);

// True for a staging sibling of `to` written by any process
bool isStagingPathFor(const std::filesystem::path& candidate, const std::filesystem::path& to);

}
