#include "monitoring.hpp"
#include <fmt/core.h>
#include <iostream>
#include <algorithm>
#include <cmath>
#include <string>

namespace fxfer::infra {

namespace {

auto now_ticks() -> std::chrono::steady_clock::rep {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

auto format_rate(double bytes_per_sec) -> std::string {
    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024.0 * 1024 * 1024) { speed /= 1024.0 * 1024 * 1024; unit = "GB/s"; }
    else if (speed > 1024.0 * 1024) { speed /= 1024.0 * 1024; unit = "MB/s"; }
    else if (speed > 1024.0) { speed /= 1024.0; unit = "KB/s"; }
    return fmt::format("{:.1f} {}", speed, unit);
}

auto format_eta(double eta_sec) -> std::string {
    if (!std::isfinite(eta_sec) || eta_sec <= 0) return "--:--";
    int seconds = static_cast<int>(eta_sec);
    const int hours = seconds / 3600;
    const int minutes = (seconds % 3600) / 60;
    seconds = seconds % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , start_ticks_(now_ticks())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
        render_();
        std::cout << "\n";
    }
}

void ProgressMonitor::set_total(std::uint64_t chunks, std::uint64_t bytes) {
    total_chunks_ = chunks;
    total_bytes_ = bytes;
    processed_chunks_ = 0;
    processed_bytes_ = 0;
    start_ticks_ = now_ticks();
}

void ProgressMonitor::update(std::uint64_t chunks, std::uint64_t bytes) {
    processed_chunks_.fetch_add(chunks, std::memory_order_relaxed);
    processed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

auto ProgressMonitor::get_stats() const -> Stats {
    using clock = std::chrono::steady_clock;
    return Stats{
        .total_chunks = total_chunks_.load(),
        .processed_chunks = processed_chunks_.load(),
        .total_bytes = total_bytes_.load(),
        .processed_bytes = processed_bytes_.load(),
        .start_time = clock::time_point(clock::duration(start_ticks_.load()))
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    render_thread_->request_stop();
    render_thread_.reset(); // joins
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    const auto stats = get_stats();
    if (stats.total_chunks == 0) return;

    const double progress = static_cast<double>(stats.processed_chunks) / stats.total_chunks;
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(progress * bar_width));

    const auto elapsed_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - stats.start_time).count();
    const double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.total_bytes > stats.processed_bytes) {
        eta_sec = (stats.total_bytes - stats.processed_bytes) / bytes_per_sec;
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    std::cout << "\r\033[K";
    fmt::print("[{}] {} | ETA: {} | {}/{} chunks",
               bar, format_rate(bytes_per_sec), format_eta(eta_sec),
               stats.processed_chunks, stats.total_chunks);
    std::cout << std::flush;
}

} // namespace fxfer::infra
