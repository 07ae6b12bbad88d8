#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace fxfer::extensions {

// Переносит на dst время модификации и биты прав src
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace fxfer::extensions
