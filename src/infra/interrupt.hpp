#pragma once

#include <atomic>
#include <csignal>

namespace ftool::infra {

extern std::atomic<int> g_interrupt_signal;

/// SIGINT/SIGTERM only raise a flag; the engine polls it between chunks and
/// entries, so a write in flight always completes.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupt_signal.load(std::memory_order_relaxed) != 0;
}

inline int interrupt_signal() {
    return g_interrupt_signal.load(std::memory_order_relaxed);
}

// Для тестов и повторных запусков в одном процессе
inline void clear_interrupt() {
    g_interrupt_signal.store(0, std::memory_order_relaxed);
}

} // namespace ftool::infra
