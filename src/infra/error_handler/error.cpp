#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/core.h>

namespace fxfer::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceNotFound:
        case ErrorCode::EmptySource:
        case ErrorCode::InvalidPath:
        case ErrorCode::InvalidArgument:
        case ErrorCode::PermissionDenied:
        case ErrorCode::DiskFull:
        case ErrorCode::PathTooLong:
        case ErrorCode::IoError:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::SourceNotFound:   return 2;
        case ErrorCode::EmptySource:      return 3;
        case ErrorCode::InvalidPath:
        case ErrorCode::InvalidArgument:  return 64; // EX_USAGE
        case ErrorCode::DiskFull:         return 20;
        case ErrorCode::PermissionDenied: return 21;
        case ErrorCode::Cancelled:        return 130; // SIGINT
        default:                          return EXIT_FAILURE;
    }
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

ErrorCode error_code_from_errno(int err) {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorCode::DiskFull;
        case ENAMETOOLONG:
            return ErrorCode::PathTooLong;
        default:
            return ErrorCode::IoError;
    }
}

Error from_errno(int err, std::string_view context,
                 const std::source_location& loc) {
    return Error{error_code_from_errno(err),
                 fmt::format("{}: {}", context, std::generic_category().message(err)), loc};
}

Error from_error_code(const std::error_code& ec, std::string_view context,
                      const std::source_location& loc) {
    auto code = ec.category() == std::generic_category() ||
                ec.category() == std::system_category()
        ? error_code_from_errno(ec.value())
        : ErrorCode::IoError;
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceNotFound:   return "SourceNotFound";
        case ErrorCode::EmptySource:      return "EmptySource";
        case ErrorCode::InvalidPath:      return "InvalidPath";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::DiskFull:         return "DiskFull";
        case ErrorCode::PathTooLong:      return "PathTooLong";
        case ErrorCode::IoError:          return "IoError";
        case ErrorCode::Cancelled:        return "Cancelled";
        case ErrorCode::Unknown:          return "Unknown";
    }
    return "Unknown";
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
