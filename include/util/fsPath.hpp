#pragma once

#include <filesystem>
#include <string>

namespace trashy::util {

namespace fs = std::filesystem;

// Absolute, lexically normalized, without resolving the final component (it may be a symlink)
inline fs::path makeAbsolute(const fs::path& path) {
    if (path.empty()) return {};
    auto abs = path.is_absolute() ? path : fs::current_path() / path;
    abs = abs.lexically_normal();
    if (abs.has_parent_path() && abs.filename().empty()) abs = abs.parent_path(); // trailing slash
    return abs;
}

// Canonical parent joined with the untouched final component
inline fs::path canonicalParent(const fs::path& absPath) {
    std::error_code ec;
    const auto parent = fs::weakly_canonical(absPath.parent_path(), ec);
    if (ec) return absPath;
    return parent / absPath.filename();
}

inline bool isWithin(const fs::path& path, const fs::path& root) {
    const auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel == ".") return false;
    const auto first = *rel.begin();
    return first != "..";
}

inline bool isSameOrWithin(const fs::path& path, const fs::path& root) {
    return path.lexically_normal() == root.lexically_normal() || isWithin(path, root);
}

} // namespace trashy::util
