#include "chunkdl/worker_pool.hpp"

namespace chunkdl {

WorkerPool::WorkerPool(std::size_t thread_count) {
    if (thread_count == 0) {
        throw std::invalid_argument("WorkerPool: thread count must be at least 1");
    }
    threads_.reserve(thread_count);
    try {
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back(&WorkerPool::threadFunc, this);
        }
    } catch (const std::exception&) {
        shutdown();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            throw std::logic_error("WorkerPool: task submitted after shutdown");
        }
        tasks_.push(std::move(task));
    }
    not_empty_.notify_one();
}

void WorkerPool::threadFunc() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            not_empty_.wait(lock, [this]() { return !running_ || !tasks_.empty(); });
            // Queued work is drained before a stopping pool lets its threads go.
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

void WorkerPool::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    not_empty_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace chunkdl
