#pragma once

#include "chunk_plan.hpp"
#include "http_client.hpp"
#include "output_file.hpp"
#include "progress.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chunkdl {

enum class DownloadPolicy {
    // Fetch every chunk into memory, then write them all.
    FetchThenWrite,
    // Fetch and write each chunk as one unit.
    FetchAndWritePipelined,
};

[[nodiscard]] std::string_view toString(DownloadPolicy policy) noexcept;
[[nodiscard]] std::optional<DownloadPolicy> parseDownloadPolicy(std::string_view name) noexcept;

// Everything a policy touches while moving one resource's chunks to disk.
struct ChunkRunContext {
    HttpClient& client;
    const std::string& url;
    const ChunkPlan& plan;
    OutputFile& file;
    ProgressSink& progress;
    std::atomic<std::uint64_t>& committed_bytes;
    // Runs the chunk units; shared with the other jobs of an engine.
    WorkerPool& pool;
    // Raised on the first chunk failure; remaining chunk work is skipped.
    std::atomic<bool>& stop;

    // Called once per chunk after its write returned.
    void onWritten(const ChunkDescriptor& descriptor) const;
};

class ChunkPolicy {
public:
    virtual ~ChunkPolicy() = default;

    [[nodiscard]] virtual DownloadPolicy kind() const noexcept = 0;

    // Fetches and writes every chunk of ctx.plan. Throws the first chunk failure.
    virtual void execute(const ChunkRunContext& ctx) const = 0;
};

class FetchThenWritePolicy final : public ChunkPolicy {
public:
    [[nodiscard]] DownloadPolicy kind() const noexcept override { return DownloadPolicy::FetchThenWrite; }
    void execute(const ChunkRunContext& ctx) const override;
};

class PipelinedPolicy final : public ChunkPolicy {
public:
    [[nodiscard]] DownloadPolicy kind() const noexcept override { return DownloadPolicy::FetchAndWritePipelined; }
    void execute(const ChunkRunContext& ctx) const override;
};

[[nodiscard]] std::shared_ptr<const ChunkPolicy> makePolicy(DownloadPolicy policy);

} // namespace chunkdl
