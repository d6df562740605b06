#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace chunkdl {

// Fixed set of threads draining a FIFO task queue. All threads are started by
// the constructor; the destructor lets queued tasks finish, then joins.
//
// A task must not block on other tasks of the same pool: with every thread
// waiting, the queued work it waits for never runs. Nested fan-out goes to a
// second pool.
class WorkerPool {
public:
    // Throws std::invalid_argument for zero threads. If starting a thread
    // fails, the threads already running are joined before the error escapes.
    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queues func(args...) and returns its future. An exception thrown by the
    // task is stored in the future.
    template <typename Func, typename... Args>
    auto submitTask(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
        using Result = std::invoke_result_t<Func, Args...>;
        auto task = std::make_shared<std::packaged_task<Result()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...));
        std::future<Result> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    void enqueue(std::function<void()> task);
    void threadFunc();
    void shutdown() noexcept;

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable not_empty_;
    bool running_{true};
};

using WorkerPoolPtr = std::shared_ptr<WorkerPool>;

} // namespace chunkdl
