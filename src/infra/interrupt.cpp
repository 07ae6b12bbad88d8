#include "interrupt.hpp"

namespace fxfer::infra {

std::atomic<bool> g_interrupted{false};

namespace {

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        // spdlog не async-signal-safe, поэтому здесь только флаг
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    static_assert(std::atomic<bool>::is_always_lock_free);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace fxfer::infra
