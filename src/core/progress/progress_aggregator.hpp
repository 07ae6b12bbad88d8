#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace fxfer::core {

struct ProgressSnapshot {
    std::uint64_t total_bytes = 0;
    std::uint64_t copied_bytes = 0;
    std::uint32_t percent = 0;
};

/// Общий для всех worker'ов счётчик скопированных байт.
///
/// `add` это неделимая операция "прибавить и прочитать": обновления сериализуются
/// под мьютексом, сумма обрезается по total_bytes. Наблюдатель вызывается внутри
/// той же критической секции, поэтому опубликованные проценты не убывают.
class ProgressAggregator {
public:
    using Observer = std::function<void(const ProgressSnapshot&)>;

    explicit ProgressAggregator(std::uint64_t total_bytes);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    auto add(std::uint64_t bytes, const Observer& observer = {}) -> ProgressSnapshot;

    [[nodiscard]] auto snapshot() const -> ProgressSnapshot;

    // floor(copied / total * 100); пустой объём считается завершённым
    [[nodiscard]] static auto percent_of(std::uint64_t copied, std::uint64_t total) noexcept -> std::uint32_t;

private:
    const std::uint64_t total_bytes_;
    std::uint64_t copied_bytes_ = 0;
    mutable std::mutex mutex_;
};

} // namespace fxfer::core
