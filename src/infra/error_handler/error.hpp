#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace fxfer::infra {

enum class ErrorCode {
    // Fatal: the job cannot be planned or continued
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    InvalidArgument,
    UnsupportedFeature,
    NoMatch,
    SizeMismatch,

    // Recoverable: the job stays resumable
    DiskFull,
    FileLocked,
    ChecksumMismatch,
    Interrupted,
    ChunkTransferFailed,
    IoError,
    RegistryError,

    // Transient remote faults
    NetworkTimeout,
    ServiceUnavailable,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::FileLocked ||
               code == ErrorCode::NetworkTimeout ||
               code == ErrorCode::ServiceUnavailable;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Maps an errno value from a POSIX call onto an ErrorCode.
[[nodiscard]] auto error_from_errno(
    int err,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace fxfer::infra
