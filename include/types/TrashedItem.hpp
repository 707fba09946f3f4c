#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace trashy::types {

struct TrashedItem {
    std::string id;                         // collision-resolved name within its store
    std::filesystem::path original_path;
    std::time_t deleted_at{};
    std::filesystem::path payload_path;     // <store>/files/<id>
    std::filesystem::path info_path;        // <store>/info/<id>.trashinfo
    std::filesystem::path store_root;

    [[nodiscard]] bool isDirectory() const;
};

}
