#pragma once

#include <atomic>
#include <csignal>

namespace rfetch::infra {

extern std::atomic<bool> g_interrupted;
extern std::atomic<bool> g_abort_requested;

// SIGINT/SIGTERM -> g_interrupted, SIGUSR2 -> g_abort_requested
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Забирает запрос на abort (SIGUSR2): true не больше одного раза на сигнал
inline bool consume_abort_request() {
    return g_abort_requested.exchange(false, std::memory_order_relaxed);
}

} // namespace rfetch::infra
