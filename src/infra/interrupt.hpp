#pragma once

#include <atomic>
#include <csignal>

namespace fxfer::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM только поднимают флаг; отмену передачи делает цикл опроса в main
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace fxfer::infra
