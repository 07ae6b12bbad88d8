#include <filesystem>
#include <system_error>
#include <fmt/core.h>
#include "metadata.hpp"

namespace fxfer::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    // Права (только POSIX-биты)
    auto perms = std::filesystem::status(src, ec).permissions();
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot stat {}", src.string())));
    }
    std::filesystem::permissions(dst, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot set permissions on {}", dst.string())));
    }

    // Временные метки
    auto time = std::filesystem::last_write_time(src, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot read mtime of {}", src.string())));
    }
    std::filesystem::last_write_time(dst, time, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot set mtime on {}", dst.string())));
    }
    return {};
}

} // namespace fxfer::extensions
