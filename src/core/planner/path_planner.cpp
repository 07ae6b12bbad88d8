#include "path_planner.hpp"
#include <algorithm>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fxfer::core {

namespace {

// "dir/" и "dir/." должны давать то же имя, что и "dir"
std::filesystem::path normalize(const std::filesystem::path& p, std::error_code& ec) {
    auto abs = std::filesystem::absolute(p, ec).lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

bool is_within(const std::filesystem::path& path, const std::filesystem::path& dir) {
    auto rel = path.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

// Совпадение по пути или по inode (симлинки, bind mount)
bool same_entry(const std::filesystem::path& a, const std::filesystem::path& b) {
    if (a == b) return true;
    // Несуществующий путь не может быть тем же файлом: ошибка означает "нет"
    std::error_code not_found;
    return std::filesystem::equivalent(a, b, not_found);
}

} // namespace

auto PathPlanner::plan(const TransferRequest& request) const -> infra::Result<TransferPlan>
{
    std::error_code ec;
    const auto source = normalize(request.source, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot resolve {}", request.source.string())));
    }
    const auto destination = normalize(request.destination_root, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot resolve {}", request.destination_root.string())));
    }

    auto status = std::filesystem::status(source, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
                               fmt::format("Source does not exist: {}", source.string())));
    }
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot stat {}", source.string())));
    }

    if (std::filesystem::is_regular_file(status)) {
        auto size = std::filesystem::file_size(source, ec);
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot read size of {}", source.string())));
        }
        const auto target = destination / source.filename();
        if (same_entry(target, source)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                                   fmt::format("Destination {} is the source file itself", target.string())));
        }
        TransferPlan plan;
        plan.single_file = true;
        plan.total_bytes = size;
        plan.tasks.push_back(FileTask{
            .source = source,
            .destination = target,
            .size_bytes = size
        });
        spdlog::debug("Planned single file {} ({} bytes)", source.string(), size);
        return plan;
    }

    if (std::filesystem::is_directory(status)) {
        if (is_within(destination, source)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                                   fmt::format("Destination {} is inside source {}",
                                               destination.string(), source.string())));
        }
        const auto dst_base = destination / source.filename();
        if (same_entry(dst_base, source) || is_within(source, dst_base)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                                   fmt::format("Copying {} into {} would overwrite the source",
                                               source.string(), destination.string())));
        }
        return plan_directory(source, destination);
    }

    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                           fmt::format("Source is neither a file nor a directory: {}", source.string())));
}

auto PathPlanner::plan_directory(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const
    -> infra::Result<TransferPlan>
{
    const auto dst_base = destination / source.filename();
    TransferPlan plan;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(source, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot open directory {}", source.string())));
    }

    for (; it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot walk {}", source.string())));
        }

        const auto& entry = *it;
        // Симлинки отдельно не обрабатываются: ссылка на файл копируется как файл
        if (!entry.is_regular_file(ec)) {
            // Битая ссылка или недоступный тип: в план не попадает
            if (ec) {
                spdlog::debug("Skipping {}: {}", entry.path().string(), ec.message());
                ec.clear();
            } else if (!entry.is_directory(ec)) {
                spdlog::debug("Skipping {}: not a regular file", entry.path().string());
                ec.clear();
            }
            continue;
        }
        auto size = entry.file_size(ec);
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot read size of {}", entry.path().string())));
        }

        plan.total_bytes += size;
        plan.tasks.push_back(FileTask{
            .source = entry.path(),
            .destination = dst_base / entry.path().lexically_relative(source),
            .size_bytes = size
        });
    }
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot walk {}", source.string())));
    }

    if (plan.tasks.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::EmptySource,
                               fmt::format("Source directory is empty: {}", source.string())));
    }

    std::sort(plan.tasks.begin(), plan.tasks.end(),
              [](const FileTask& a, const FileTask& b) { return a.source < b.source; });

    spdlog::debug("Planned {} files ({} bytes) from {}", plan.tasks.size(), plan.total_bytes, source.string());
    return plan;
}

} // namespace fxfer::core
