#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>

namespace fxfer::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::FileNotFound:        return "FileNotFound";
        case ErrorCode::PermissionDenied:    return "PermissionDenied";
        case ErrorCode::InvalidPath:         return "InvalidPath";
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::UnsupportedFeature:  return "UnsupportedFeature";
        case ErrorCode::NoMatch:             return "NoMatch";
        case ErrorCode::SizeMismatch:        return "SizeMismatch";
        case ErrorCode::DiskFull:            return "DiskFull";
        case ErrorCode::FileLocked:          return "FileLocked";
        case ErrorCode::ChecksumMismatch:    return "ChecksumMismatch";
        case ErrorCode::Interrupted:         return "Interrupted";
        case ErrorCode::ChunkTransferFailed: return "ChunkTransferFailed";
        case ErrorCode::IoError:             return "IoError";
        case ErrorCode::RegistryError:       return "RegistryError";
        case ErrorCode::NetworkTimeout:      return "NetworkTimeout";
        case ErrorCode::ServiceUnavailable:  return "ServiceUnavailable";
        case ErrorCode::Unknown:             return "Unknown";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidPath:
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnsupportedFeature:
        case ErrorCode::NoMatch:
        case ErrorCode::SizeMismatch:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::NoMatch:             return 2;
        case ErrorCode::SizeMismatch:        return 3;
        case ErrorCode::DiskFull:            return 20;
        case ErrorCode::FileLocked:          return 21;
        case ErrorCode::ChecksumMismatch:    return 22;
        case ErrorCode::ChunkTransferFailed: return 23;
        case ErrorCode::Interrupted:         return 130; // SIGINT
        default:                             return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error error_from_errno(int err, std::string_view context,
                       const std::source_location& loc) {
    ErrorCode code = ErrorCode::IoError;
    switch (err) {
        case ENOENT:
        case ENOTDIR:       code = ErrorCode::FileNotFound; break;
        case EACCES:
        case EPERM:         code = ErrorCode::PermissionDenied; break;
        case ENOSPC:
        case EDQUOT:        code = ErrorCode::DiskFull; break;
        case EAGAIN:
        case EBUSY:         code = ErrorCode::FileLocked; break;
        case ETIMEDOUT:     code = ErrorCode::NetworkTimeout; break;
        case ENAMETOOLONG:  code = ErrorCode::InvalidPath; break;
        default: break;
    }
    return Error{code, fmt::format("{}: {}", context, std::strerror(err)), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace fxfer::infra
