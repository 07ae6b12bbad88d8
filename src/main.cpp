#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/engine/transfer_engine.hpp"
#include "adapters/fs.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <optional>
#include <thread>
#include <variant>

using GIT = fxfer::build_info::GitInfo;
using ARGS = fxfer::args_parser::CLIArgs;

constexpr auto load_from_cli = fxfer::infra::config_from_cli;
constexpr auto load_config_file = fxfer::infra::load_config_from_file;
constexpr auto args_parser = fxfer::args_parser::parse_args;
constexpr auto git = fxfer::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("fxfer {}\n", git.version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
__out_config_verse(const fxfer::infra::Config& config)
-> void {
    spdlog::debug("Threads: {}", config.pool_size());
    spdlog::debug("Buffer size: {}", config.buffer_size.value_or(fxfer::adapters::fs::kDefaultBufferSize));
    spdlog::debug("Preserve metadata: {}", config.preserve_metadata ? "yes" : "no");
    spdlog::debug("Skip unchanged: {}", config.skip_unchanged ? "yes" : "no");
    spdlog::debug("Poll interval: {} ms", config.poll_active.count());
}

int main(int argc, char** argv)
{
    using namespace fxfer;

    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        infra::install_signal_handler();

        int exit_code = 0;
        auto args_opt = ::args_parser(argc, argv, exit_code);
        if (!args_opt) {
            return exit_code; // --help или ошибка
        }
        const ARGS& args = *args_opt;

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.log_level) {
            if (infra::is_valid_log_level(*config.log_level)) {
                spdlog::set_level(spdlog::level::from_str(*config.log_level));
            } else {
                spdlog::warn("Unknown log level '{}', keeping info", *config.log_level);
            }
        }
        if (config.quiet) {
            spdlog::set_level(spdlog::level::err);
        }
        __out_config_verse(config);

        core::TransferEngine engine(config);
        infra::ProgressMonitor monitor(config.progress, config.quiet);

        auto start_time = std::chrono::steady_clock::now();

        auto handle = engine.start_transfer(args.source, args.destination);
        if (!handle) {
            auto err = infra::log_and_return(std::move(handle.error()));
            return err.to_exit_code();
        }

        if (!monitor.is_enabled()) {
            spdlog::info("Copying {} -> {}", args.source, args.destination);
        }

        // Цикл опроса: единственный потребитель канала событий
        std::optional<core::TransferEvent> terminal;
        while (!terminal) {
            if (infra::is_interrupted()) {
                engine.cancel(*handle);
            }

            for (auto& event : engine.poll_events(*handle)) {
                spdlog::trace("Event: {}", core::describe(event));
                if (const auto* progress = std::get_if<core::ProgressEvent>(&event)) {
                    monitor.update(progress->percent, progress->file_name);
                } else {
                    terminal = std::move(event);
                }
            }
            monitor.render();

            if (terminal) break;
            // Терминальное событие уже в очереди, если передача не активна
            if (engine.is_active(*handle)) {
                std::this_thread::sleep_for(config.poll_active);
            }
        }
        monitor.finish();

        auto summary = engine.wait(*handle);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (const auto* error = std::get_if<core::ErrorEvent>(&*terminal)) {
            spdlog::error("Transfer failed: {}", error->message);
            if (summary && summary->error && summary->error->is_filesystem_error()) {
                spdlog::info("Stopped at {}%, files copied before the failure were kept",
                             monitor.get_stats().percent);
            }
            return summary && summary->error ? summary->error->to_exit_code() : 1;
        }
        if (std::holds_alternative<core::CancelledEvent>(*terminal)) {
            spdlog::warn("Transfer cancelled at {}% ({})",
                         monitor.get_stats().percent, monitor.get_stats().current_file);
            return infra::make_error(infra::ErrorCode::Cancelled, "cancelled").to_exit_code();
        }

        spdlog::info("Transfer completed successfully!");
        if (summary) {
            spdlog::info("Files copied: {}", summary->files_copied);
            spdlog::info("Files unchanged: {}", summary->files_unchanged);
            spdlog::info("Bytes: {} ({:.2f} MB)",
                         summary->copied_bytes,
                         summary->copied_bytes / 1024.0 / 1024.0);
            spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);

            if (summary->copied_bytes > 0 && duration.count() > 0) {
                double speed_mbps = (summary->copied_bytes / 1024.0 / 1024.0) / (duration.count() / 1000.0);
                spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
            }
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
