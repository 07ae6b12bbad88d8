#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <thread>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace fxfer::infra {

    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (!other.preserve_metadata) preserve_metadata = false; // CLI может отключить
        if (other.skip_unchanged) skip_unchanged = true;
        if (!other.progress) progress = false;
        if (other.quiet) quiet = true;
        if (other.log_level) log_level = other.log_level;
    }

    auto Config::pool_size() const -> std::uint32_t {
        if (threads && *threads > 0) return *threads;
        auto hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }

    auto is_valid_log_level(std::string_view name) -> bool {
        // from_str отдаёт off для любого незнакомого имени
        return spdlog::level::from_str(std::string(name)) != spdlog::level::off || name == "off";
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".fxfer.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "fxfer" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "fxfer" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
            if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();

            if (config["preserve_metadata"]) cfg.preserve_metadata = config["preserve_metadata"].as<bool>();
            if (config["skip_unchanged"]) cfg.skip_unchanged = config["skip_unchanged"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (config["poll_active_ms"]) {
                cfg.poll_active = std::chrono::milliseconds(config["poll_active_ms"].as<std::uint32_t>());
            }

            if (cfg.poll_active.count() == 0) {
                return std::unexpected(fmt::format("{}: poll_active_ms must be positive", path.string()));
            }
            if (cfg.log_level && !is_valid_log_level(*cfg.log_level)) {
                return std::unexpected(fmt::format("{}: unknown log_level '{}'", path.string(), *cfg.log_level));
            }
            if (cfg.buffer_size && *cfg.buffer_size == 0) {
                return std::unexpected(fmt::format("{}: buffer_size must be positive", path.string()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден: пустой конфиг, не ошибка
        return Config{};
    }

    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.threads = args.threads;
        cfg.buffer_size = args.buffer_size;
        cfg.preserve_metadata = args.preserve_metadata;
        cfg.skip_unchanged = args.skip_unchanged;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace fxfer::infra
