#pragma once

#include "chunk_plan.hpp"
#include "download_policy.hpp"
#include "download_task.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "worker_pool.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace chunkdl {

// Downloads one resource: probe, plan, move chunks to disk under the given
// policy, verify the result. A job runs once; Done and Failed are terminal.
// Chunk units run on `chunk_pool`; run() blocks on them, so it must not itself
// execute on that pool.
class ResourceDownloadJob {
public:
    ResourceDownloadJob(DownloadTask task,
                        HttpClientPtr client,
                        std::shared_ptr<const ChunkPolicy> policy,
                        std::size_t worker_count,
                        ProgressSinkPtr progress,
                        WorkerPoolPtr chunk_pool);

    // Throws DownloadError (or std::logic_error when run twice). The failure is
    // also recorded in the progress sink. A failed job leaves its output file as is.
    void run();

    [[nodiscard]] JobState state() const { return progress_->state(); }
    [[nodiscard]] const DownloadTask& task() const noexcept { return task_; }
    [[nodiscard]] const ProgressSinkPtr& progress() const noexcept { return progress_; }
    [[nodiscard]] const std::optional<ResourceMetadata>& metadata() const noexcept { return metadata_; }

private:
    [[nodiscard]] ChunkPlan planDownload();
    void verify(OutputFile& file, std::uint64_t committed_bytes, std::uint64_t total_bytes) const;

    DownloadTask task_;
    HttpClientPtr client_;
    std::shared_ptr<const ChunkPolicy> policy_;
    std::size_t worker_count_;
    ProgressSinkPtr progress_;
    WorkerPoolPtr chunk_pool_;
    std::optional<ResourceMetadata> metadata_;
};

} // namespace chunkdl
