#pragma once

#include <filesystem>
#include <cstddef>
#include <cstdint>
#include "infra/error_handler/error.hpp"

namespace fxfer::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // 1 MB – 100 MB
    Uring,       // >= 100 MB (Linux, io_uring), иначе Buffered
};

inline constexpr std::size_t kDefaultBufferSize = 1024 * 1024; // 1 MB

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

/// Копирует содержимое src в dst (dst создаётся или усекается).
/// При ошибке dst может остаться недописанным, он не удаляется.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy = CopyStrategy::Buffered,
    std::size_t buffer_size = kDefaultBufferSize
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size = kDefaultBufferSize
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_uring(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size = kDefaultBufferSize
) -> infra::VoidResult;

// Создаёт недостающие каталоги для dst
[[nodiscard]] auto ensure_parent_directories(const std::filesystem::path& dst) -> infra::VoidResult;

// dst существует, того же размера и не старше src (с точностью до секунды)
[[nodiscard]] auto is_up_to_date(const std::filesystem::path& src,
                                 const std::filesystem::path& dst) -> bool;

} // namespace fxfer::adapters::fs
