#include "interrupt.hpp"

namespace ftool::infra {

std::atomic<int> g_interrupt_signal{0};

namespace {

// Внутри обработчика нельзя логировать: spdlog не async-signal-safe
void on_signal(int sig) {
    g_interrupt_signal.store(sig, std::memory_order_relaxed);
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

} // namespace ftool::infra
