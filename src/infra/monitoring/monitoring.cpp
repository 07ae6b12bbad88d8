#include "monitoring.hpp"
#include <fmt/core.h>
#include <iostream>
#include <cmath>

namespace fxfer::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
{
    stats_.start_time = std::chrono::steady_clock::now();
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::update(std::uint32_t percent, std::string_view file_name) {
    stats_.percent = percent > 100 ? 100 : percent;
    stats_.current_file.assign(file_name);
    dirty_ = true;
}

void ProgressMonitor::finish() {
    if (rendered_) {
        std::cout << "\n" << std::flush; // финальный перенос
        rendered_ = false;
    }
}

auto ProgressMonitor::format_eta(double seconds) -> std::string {
    if (!std::isfinite(seconds) || seconds <= 0) {
        return "inf";
    }
    int total = static_cast<int>(seconds);
    int hours = total / 3600;
    int minutes = (total % 3600) / 60;
    int secs = total % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return fmt::format("{:02d}:{:02d}", minutes, secs);
}

void ProgressMonitor::render() {
    if (!enabled_ || !dirty_) return;
    dirty_ = false;

    constexpr int bar_width = 20;
    const int filled = static_cast<int>(stats_.percent) * bar_width / 100;

    // ETA по скорости роста процента
    auto elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - stats_.start_time).count();
    double eta_sec = 0.0;
    if (stats_.percent > 0 && stats_.percent < 100 && elapsed_sec > 0) {
        eta_sec = elapsed_sec * (100.0 - stats_.percent) / stats_.percent;
    }
    std::string eta_str = stats_.percent >= 100 ? "00:00" : format_eta(eta_sec);

    // Очистка строки и вывод
    std::cout << "\r\033[K"; // ANSI: очистить строку

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    fmt::print("[{}] {:3d}% | ETA: {} | {}", bar, stats_.percent, eta_str, stats_.current_file);
    std::cout << std::flush;
    rendered_ = true;
}

} // namespace fxfer::infra
