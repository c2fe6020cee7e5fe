#include "interrupt.hpp"

namespace fxfer::infra {

std::atomic<bool> g_interrupted{false};

static_assert(std::atomic<bool>::is_always_lock_free);

extern "C" void fxfer_signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, fxfer_signal_handler);
    std::signal(SIGTERM, fxfer_signal_handler);
}

bool InterruptController::consume() noexcept {
    const bool local = requested_.exchange(false, std::memory_order_relaxed);
    const bool signalled = g_interrupted.exchange(false, std::memory_order_relaxed);
    return local || signalled;
}

} // namespace fxfer::infra
