#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace trashy::types {

enum class ErrorCode {
    NotFound,
    PermissionDenied,
    UnresolvableVolume,
    NameTaken,
    NameExhausted,
    MoveFailed,
    DestinationExists,
    Corrupt,
    OrphanedPayload,
    OrphanedMetadata,
    InvalidPath,
    CrossDevice,
    NotConfirmed
};

const char* to_string(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message, std::filesystem::path path = {});

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Builds an Error from an errno value, using `fallback` for anything without a dedicated code
    static Error fromErrno(int err, const std::string& what, const std::filesystem::path& path,
                           ErrorCode fallback = ErrorCode::MoveFailed);

private:
    ErrorCode code_;
    std::filesystem::path path_;
};

}
