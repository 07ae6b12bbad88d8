#include "progress_aggregator.hpp"
#include <algorithm>

namespace fxfer::core {

ProgressAggregator::ProgressAggregator(std::uint64_t total_bytes)
    : total_bytes_(total_bytes) {}

auto ProgressAggregator::add(std::uint64_t bytes, const Observer& observer) -> ProgressSnapshot
{
    std::lock_guard lock(mutex_);
    copied_bytes_ += std::min(bytes, total_bytes_ - copied_bytes_);

    ProgressSnapshot snap{
        .total_bytes = total_bytes_,
        .copied_bytes = copied_bytes_,
        .percent = percent_of(copied_bytes_, total_bytes_)
    };
    if (observer) {
        observer(snap);
    }
    return snap;
}

auto ProgressAggregator::snapshot() const -> ProgressSnapshot
{
    std::lock_guard lock(mutex_);
    return ProgressSnapshot{
        .total_bytes = total_bytes_,
        .copied_bytes = copied_bytes_,
        .percent = percent_of(copied_bytes_, total_bytes_)
    };
}

auto ProgressAggregator::percent_of(std::uint64_t copied, std::uint64_t total) noexcept -> std::uint32_t
{
    if (total == 0) return 100;
    // copied * 100 может переполниться на очень больших объёмах
    const auto whole = copied / total;
    const auto rest = copied % total;
    const auto pct = whole * 100 + static_cast<std::uint64_t>(
        static_cast<unsigned __int128>(rest) * 100 / total);
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(pct, 100));
}

} // namespace fxfer::core
