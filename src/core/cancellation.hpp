#pragma once

#include <atomic>

namespace fxfer::core {

// Флаг кооперативной отмены: выставляется не более одного раза и не сбрасывается.
// Каждая передача получает собственный экземпляр.
class CancellationSignal {
public:
    // true, если именно этот вызов выставил флаг
    bool request() noexcept {
        return !requested_.exchange(true, std::memory_order_acq_rel);
    }

    [[nodiscard]] bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> requested_{false};
};

} // namespace fxfer::core
