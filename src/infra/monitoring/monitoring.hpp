#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace fxfer::infra {

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_chunks = 0;
        std::uint64_t processed_chunks = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Resets counters; called at the start of every run.
    void set_total(std::uint64_t chunks, std::uint64_t bytes);
    void update(std::uint64_t chunks = 0, std::uint64_t bytes = 0);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> processed_chunks_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};
    std::atomic<std::uint64_t> total_chunks_{0};
    std::atomic<std::uint64_t> total_bytes_{0};

    const bool enabled_;
    const bool quiet_;
    std::atomic<std::chrono::steady_clock::rep> start_ticks_;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace fxfer::infra
