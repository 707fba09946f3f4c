#pragma once

#include <filesystem>
#include <string>

namespace trashy::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes `data` to `path` (created 0600, truncated) and fsyncs it; returns 0 or an errno value
int writeFileDurable(const std::filesystem::path& path, const std::string& data);

// Flushes directory entries after renames; errors are ignored by callers that cannot act on them
int fsyncDir(const std::filesystem::path& dir);

}
