#include "chunkdl/download_engine.hpp"

#include "chunkdl/curl_http_client.hpp"
#include "chunkdl/errors.hpp"
#include "chunkdl/resource_download_job.hpp"

#include <future>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace chunkdl {

namespace {

HttpClientPtr makeCurlClient(std::uint32_t retry) {
    CurlHttpClient::Options options;
    options.retry = retry;
    return std::make_shared<CurlHttpClient>(std::move(options));
}

} // namespace

DownloadEngine::DownloadEngine(EngineOptions options)
    : DownloadEngine(options, makeCurlClient(options.retry)) {}

DownloadEngine::DownloadEngine(EngineOptions options, HttpClientPtr client)
    : options_(std::move(options)), client_(std::move(client)), policy_(makePolicy(options_.policy)) {
    if (options_.workers == 0) {
        throw std::invalid_argument("DownloadEngine: worker count must be at least 1");
    }
    if (options_.max_active_tasks == 0 || options_.pool_threads == 0) {
        throw std::invalid_argument("DownloadEngine: task and pool thread counts must be at least 1");
    }
    if (!client_) {
        throw std::invalid_argument("DownloadEngine: http client is required");
    }
    chunk_pool_ = std::make_shared<WorkerPool>(options_.pool_threads);
    task_pool_ = std::make_unique<WorkerPool>(options_.max_active_tasks);
}

void DownloadEngine::run(const std::vector<DownloadTask>& tasks) {
    std::vector<std::unique_ptr<ResourceDownloadJob>> jobs;
    std::vector<ProgressSinkPtr> sinks;
    jobs.reserve(tasks.size());
    sinks.reserve(tasks.size());

    for (const auto& task : tasks) {
        DownloadTask resolved{task.url, options_.directory / task.destination};
        auto sink = std::make_shared<ProgressSink>(resolved.url, resolved.destination.string());
        jobs.push_back(std::make_unique<ResourceDownloadJob>(std::move(resolved), client_, policy_,
                                                             options_.workers, sink, chunk_pool_));
        sinks.push_back(std::move(sink));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        sinks_ = sinks;
        results_.clear();
    }

    spdlog::info("DownloadEngine: {} tasks ({} at a time), {} workers each, {} pool threads, policy {}",
                 jobs.size(), task_pool_->size(), options_.workers, chunk_pool_->size(), toString(options_.policy));

    std::vector<std::future<void>> running;
    running.reserve(jobs.size());
    auto waitAll = [&running]() {
        for (auto& future : running) {
            future.wait();
        }
    };
    try {
        for (auto& job : jobs) {
            ResourceDownloadJob* raw = job.get();
            running.push_back(task_pool_->submitTask([raw]() { raw->run(); }));
        }
    } catch (const std::exception&) {
        // Jobs already queued still use `jobs`.
        waitAll();
        throw;
    }
    waitAll();

    std::vector<std::exception_ptr> errors(jobs.size());
    for (std::size_t i = 0; i < running.size(); ++i) {
        try {
            running[i].get();
        } catch (const std::exception&) {
            errors[i] = std::current_exception();
        }
    }

    std::vector<TaskResult> results;
    results.reserve(jobs.size());
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        results.push_back(TaskResult{jobs[i]->task(), errors[i]});
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        results_ = results;
    }

    for (const auto& result : results) {
        if (!result.ok()) {
            throw AggregateError(result.task.url, result.error);
        }
    }
}

std::vector<Progress> DownloadEngine::progress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Progress> out;
    out.reserve(sinks_.size());
    for (const auto& sink : sinks_) {
        out.push_back(sink->snapshot());
    }
    return out;
}

std::vector<TaskResult> DownloadEngine::results() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return results_;
}

} // namespace chunkdl
