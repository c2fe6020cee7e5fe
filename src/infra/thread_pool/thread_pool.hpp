#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <type_traits>

namespace fxfer::infra {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Blocks until the queue is empty and no task is running.
    void wait();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

private:
    using Task = std::move_only_function<void()>;

    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    std::size_t active_tasks_ = 0;
    bool stop_ = false;
};

// =============== Template implementation ===============

template<typename F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>>;

    std::packaged_task<ReturnType()> task(std::forward<F>(f));
    auto future = task.get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace(std::move(task));
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    // jthread joins on destruction; workers drain the queue before exiting
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                // stop_ set or stop requested with nothing left to do
                if (stop_ || st.stop_requested()) return;
                continue;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

} // namespace fxfer::infra
