#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace fxfer::infra {

enum class ErrorCode {
    // Ошибки планирования (до начала копирования)
    SourceNotFound,
    EmptySource,
    InvalidPath,
    InvalidArgument,

    // FilesystemError: ошибки во время копирования
    PermissionDenied,
    DiskFull,
    PathTooLong,
    IoError,

    // Системные
    Cancelled,
    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
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

    [[nodiscard]] auto is_filesystem_error() const -> bool {
        return code == ErrorCode::PermissionDenied ||
               code == ErrorCode::DiskFull ||
               code == ErrorCode::PathTooLong ||
               code == ErrorCode::IoError;
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

/// Переводит errno в код из семейства FilesystemError.
[[nodiscard]] auto error_code_from_errno(int err) -> ErrorCode;

/// Собирает Error из errno: "<context>: <strerror>".
[[nodiscard]] auto from_errno(
    int err,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// То же для std::error_code из std::filesystem.
[[nodiscard]] auto from_error_code(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace fxfer::infra
