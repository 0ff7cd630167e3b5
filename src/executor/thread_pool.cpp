/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace verified_compute {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // jthreads join in their destructors, after in-flight tasks return
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
    }
    queue_cv_.notify_all();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task();
        --active_tasks_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace verified_compute
