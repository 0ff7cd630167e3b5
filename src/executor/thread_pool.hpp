/**
 * @file thread_pool.hpp
 * @brief std::jthread-based pool that runs blocking worker RPCs.
 *
 * Futures returned by submit() may be abandoned: a task whose caller
 * stopped waiting still runs to completion and its result is dropped.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace verified_compute {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution. Throws std::runtime_error after shutdown().
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Stop accepting work; queued tasks still run before the workers exit.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_ = true;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace verified_compute
