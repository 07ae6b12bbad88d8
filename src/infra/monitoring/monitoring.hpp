#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace fxfer::infra {

// Строка прогресса в терминале. Обновляется из цикла опроса событий,
// собственного потока отрисовки нет.
class ProgressMonitor {
public:
    struct Stats {
        std::uint32_t percent = 0;
        std::string current_file;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void update(std::uint32_t percent, std::string_view file_name);
    void render();

    // Завершает строку прогресса переводом строки
    void finish();

    [[nodiscard]] auto get_stats() const -> const Stats& { return stats_; }
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    // "mm:ss" или "hh:mm:ss"; "inf", если оценки нет
    [[nodiscard]] static auto format_eta(double seconds) -> std::string;

private:
    Stats stats_;
    const bool enabled_;
    bool rendered_ = false;
    bool dirty_ = false;
};

} // namespace fxfer::infra
