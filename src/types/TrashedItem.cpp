#include "types/TrashedItem.hpp"

using namespace trashy::types;

bool TrashedItem::isDirectory() const {
    std::error_code ec;
    return std::filesystem::is_directory(std::filesystem::symlink_status(payload_path, ec));
}
