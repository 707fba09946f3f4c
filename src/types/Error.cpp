#include "types/Error.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/format.h>

using namespace trashy::types;

const char* trashy::types::to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::UnresolvableVolume: return "UnresolvableVolume";
        case ErrorCode::NameTaken: return "NameTaken";
        case ErrorCode::NameExhausted: return "NameExhausted";
        case ErrorCode::MoveFailed: return "MoveFailed";
        case ErrorCode::DestinationExists: return "DestinationExists";
        case ErrorCode::Corrupt: return "Corrupt";
        case ErrorCode::OrphanedPayload: return "OrphanedPayload";
        case ErrorCode::OrphanedMetadata: return "OrphanedMetadata";
        case ErrorCode::InvalidPath: return "InvalidPath";
        case ErrorCode::CrossDevice: return "CrossDevice";
        case ErrorCode::NotConfirmed: return "NotConfirmed";
    }
    return "?";
}

Error::Error(const ErrorCode code, const std::string& message, std::filesystem::path path)
    : std::runtime_error(message), code_(code), path_(std::move(path)) {}

Error Error::fromErrno(const int err, const std::string& what, const std::filesystem::path& path,
                       const ErrorCode fallback) {
    ErrorCode code;
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            code = ErrorCode::NotFound;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            code = ErrorCode::PermissionDenied;
            break;
        case EXDEV:
            code = ErrorCode::CrossDevice;
            break;
        default:
            code = fallback;
    }
    return {code, fmt::format("{} '{}': {}", what, path.string(), std::strerror(err)), path};
}
