#pragma once

#include <filesystem>
#include <string>
#include <sys/types.h>

namespace trashy::volume {

struct Volume {
    dev_t device{};
    std::filesystem::path mount_point;
    std::string source;     // block device or remote spec, as listed in the mount table
    std::string fs_type;

    bool operator==(const Volume& other) const { return device == other.device; }
};

}
