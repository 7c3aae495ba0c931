#include "interrupt.hpp"

namespace rfetch::infra {

std::atomic<bool> g_interrupted{false};
std::atomic<bool> g_abort_requested{false};

// async-signal-safe: только атомики
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    } else if (sig == SIGUSR2) {
        g_abort_requested.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGUSR2, signal_handler);
}

} // namespace rfetch::infra
