#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <thread>
#include <functional>
#include <optional>

namespace fxfer::infra {
/*

auto bytes = infra::with_retry([&]() {
    return storage.ranged_read(path, offset, length);
}, infra::RetryPolicy{ .max_attempts = 5 });


*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100);
    double backoff_factor = 2.0; // exponential backoff
};

// Called before each new attempt with the failed attempt number (1-based).
using RetryObserver = std::function<void(int attempt, const Error& err)>;

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              const RetryObserver& on_retry = {})
    -> decltype(operation())
{
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (int attempt = 0; attempt < attempts - 1; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        if (!err.is_transient()) {
            return result;
        }
        if (on_retry) {
            on_retry(attempt + 1, err);
        }

        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * std::pow(policy.backoff_factor, attempt));
        std::this_thread::sleep_for(delay);
    }

    // last attempt: its result is final either way
    return operation();
}

} // namespace fxfer::infra
