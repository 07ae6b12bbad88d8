#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>

namespace fxfer::args_parser{
    struct CLIArgs;
}

namespace fxfer::infra {

struct Config {
    // I/O
    std::optional<std::uint32_t> threads;     // размер пула, по умолчанию hardware_concurrency
    std::optional<std::size_t> buffer_size;   // bytes

    // Behavior
    bool preserve_metadata = true;
    bool skip_unchanged = false;

    // Потребитель событий (CLI)
    std::chrono::milliseconds poll_active{50};
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto pool_size() const -> std::uint32_t;
};

// Имя уровня, которое понимает spdlog ("trace" .. "off")
[[nodiscard]] auto is_valid_log_level(std::string_view name) -> bool;

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.fxfer.yaml
///   2. $XDG_CONFIG_HOME/fxfer/config.yaml или ~/.config/fxfer/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Разбирает конкретный файл. Ошибка разбора или отсутствие файла возвращаются как ошибка.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace fxfer::infra
