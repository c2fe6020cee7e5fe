#pragma once

#include <atomic>
#include <csignal>

namespace fxfer::infra {

// Set from the SIGINT/SIGTERM handler; lock-free so the handler stays async-signal-safe.
extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

/// Cancellation token for TransferEngine::run(). A request, programmatic or
/// from a signal, stays pending until consume().
class InterruptController {
public:
    InterruptController() = default;

    InterruptController(const InterruptController&) = delete;
    InterruptController& operator=(const InterruptController&) = delete;

    void request_stop() noexcept {
        requested_.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool stop_requested() const noexcept {
        return requested_.load(std::memory_order_relaxed) || is_interrupted();
    }

    // Clears a pending request; returns true if there was one.
    bool consume() noexcept;

private:
    std::atomic<bool> requested_{false};
};

} // namespace fxfer::infra
