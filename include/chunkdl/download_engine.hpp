#pragma once

#include "download_policy.hpp"
#include "download_task.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "worker_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace chunkdl {

struct EngineOptions {
    // Chunks per resource.
    std::size_t workers{4};
    // Resources downloaded at the same time; further tasks wait as Pending.
    std::size_t max_active_tasks{4};
    // Threads shared by the chunk work of all resources.
    std::size_t pool_threads{16};
    std::uint32_t retry{2};
    std::filesystem::path directory{"."};
    DownloadPolicy policy{DownloadPolicy::FetchAndWritePipelined};
};

struct TaskResult {
    DownloadTask task;            // destination resolved against EngineOptions::directory
    std::exception_ptr error;     // null on success

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// Runs one ResourceDownloadJob per task. Jobs run on a task pool of
// max_active_tasks threads and hand their chunks to a chunk pool of
// pool_threads threads, so the thread count stays fixed however many tasks
// are submitted. Tasks are independent: a failing task never cancels the others.
class DownloadEngine {
public:
    // Uses a CurlHttpClient configured with options.retry.
    explicit DownloadEngine(EngineOptions options);
    DownloadEngine(EngineOptions options, HttpClientPtr client);

    // Blocks until every task finished. Throws AggregateError carrying the
    // failure of the first failed task in submission order.
    void run(const std::vector<DownloadTask>& tasks);

    // Snapshots of every task of the current (or last) run, in submission
    // order. Safe to call from another thread while run() executes.
    [[nodiscard]] std::vector<Progress> progress() const;

    // Per-task outcome of the last completed run.
    [[nodiscard]] std::vector<TaskResult> results() const;

    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

private:
    EngineOptions options_;
    HttpClientPtr client_;
    std::shared_ptr<const ChunkPolicy> policy_;
    // Declared in this order so the task pool (whose jobs wait on chunk
    // units) is destroyed first.
    WorkerPoolPtr chunk_pool_;
    std::unique_ptr<WorkerPool> task_pool_;

    mutable std::mutex state_mutex_;
    std::vector<ProgressSinkPtr> sinks_;
    std::vector<TaskResult> results_;
};

} // namespace chunkdl
