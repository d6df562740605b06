#include "chunkdl/resource_download_job.hpp"

#include "chunkdl/errors.hpp"
#include "chunkdl/output_file.hpp"

#include <atomic>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace chunkdl {

ResourceDownloadJob::ResourceDownloadJob(DownloadTask task,
                                         HttpClientPtr client,
                                         std::shared_ptr<const ChunkPolicy> policy,
                                         std::size_t worker_count,
                                         ProgressSinkPtr progress,
                                         WorkerPoolPtr chunk_pool)
    : task_(std::move(task)),
      client_(std::move(client)),
      policy_(std::move(policy)),
      worker_count_(worker_count),
      progress_(std::move(progress)),
      chunk_pool_(std::move(chunk_pool)) {
    if (!client_ || !policy_ || !progress_ || !chunk_pool_) {
        throw std::invalid_argument("ResourceDownloadJob: client, policy, progress sink and pool are required");
    }
    if (worker_count_ == 0) {
        throw std::invalid_argument("ResourceDownloadJob: worker count must be at least 1");
    }
}

void ResourceDownloadJob::run() {
    if (progress_->state() != JobState::Pending) {
        throw std::logic_error("ResourceDownloadJob: " + task_.url + " already ran");
    }

    try {
        const ChunkPlan plan = planDownload();

        // The file is only touched once planning succeeded.
        OutputFile file{task_.destination};
        std::atomic<std::uint64_t> committed{0};
        std::atomic<bool> stop{false};

        const ChunkRunContext ctx{*client_, task_.url, plan, file, *progress_, committed, *chunk_pool_, stop};
        policy_->execute(ctx);

        progress_->setState(JobState::Verifying);
        verify(file, committed.load(), plan.totalBytes());
    } catch (const std::exception& ex) {
        spdlog::error("ResourceDownloadJob: {} -> {} failed: {}", task_.url, task_.destination.string(),
                      ex.what());
        progress_->registerError(ex.what());
        progress_->setState(JobState::Failed);
        throw;
    }

    progress_->setState(JobState::Done);
    spdlog::info("ResourceDownloadJob: {} -> {} done ({} bytes)", task_.url, task_.destination.string(),
                 progress_->downloaded());
}

ChunkPlan ResourceDownloadJob::planDownload() {
    progress_->setState(JobState::Planning);

    metadata_ = client_->head(task_.url);
    progress_->setTotal(metadata_->total_bytes);

    ChunkPlan plan = ChunkPlan::plan(*metadata_, worker_count_);
    spdlog::debug("ResourceDownloadJob: {} ranges={} total={} chunks={} chunk_size={} policy={}", task_.url,
                  metadata_->supports_ranges, plan.totalBytes(), plan.size(), plan.chunkSize(),
                  toString(policy_->kind()));
    return plan;
}

void ResourceDownloadJob::verify(OutputFile& file, std::uint64_t committed_bytes, std::uint64_t total_bytes) const {
    file.sync();

    if (committed_bytes != total_bytes) {
        throw DownloadError(ErrorKind::IncompleteDownload,
                            fmt::format("{}: chunks committed {} bytes, expected {}", task_.destination.string(),
                                        committed_bytes, total_bytes));
    }

    const std::uint64_t on_disk = file.size();
    if (on_disk != total_bytes) {
        throw DownloadError(ErrorKind::IncompleteDownload,
                            fmt::format("{}: expected {} bytes on disk, got {}", task_.destination.string(),
                                        total_bytes, on_disk));
    }
}

} // namespace chunkdl
