#include "chunkdl/download_policy.hpp"

#include "chunkdl/chunk_set.hpp"
#include "chunkdl/detail/parallel.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace chunkdl {

std::string_view toString(DownloadPolicy policy) noexcept {
    switch (policy) {
        case DownloadPolicy::FetchThenWrite: return "fetch-then-write";
        case DownloadPolicy::FetchAndWritePipelined: return "pipelined";
    }
    return "unknown";
}

std::optional<DownloadPolicy> parseDownloadPolicy(std::string_view name) noexcept {
    if (name == "fetch-then-write") {
        return DownloadPolicy::FetchThenWrite;
    }
    if (name == "pipelined") {
        return DownloadPolicy::FetchAndWritePipelined;
    }
    return std::nullopt;
}

void ChunkRunContext::onWritten(const ChunkDescriptor& descriptor) const {
    committed_bytes.fetch_add(descriptor.size);
    progress.advance(descriptor.size);
}

void FetchThenWritePolicy::execute(const ChunkRunContext& ctx) const {
    const auto descriptors = ctx.plan.descriptors();
    std::vector<std::optional<Chunk>> fetched(descriptors.size());

    ctx.progress.setState(JobState::Fetching);
    detail::runConcurrently(ctx.pool, descriptors.size(), ctx.stop, [&](std::size_t i) {
        fetched[i].emplace(Chunk::fetch(descriptors[i], ctx.client, ctx.url));
    });

    ChunkSet chunks{ctx.plan.totalBytes()};
    for (auto& chunk : fetched) {
        chunks.add(std::move(*chunk));
    }
    chunks.verify();
    spdlog::debug("FetchThenWritePolicy: {} chunks ({} bytes) of {} in memory", chunks.size(),
                  chunks.totalBytes(), ctx.url);

    ctx.progress.setState(JobState::Writing);
    chunks.writeAll(ctx.file, [&](const ChunkDescriptor& descriptor) { ctx.onWritten(descriptor); }, ctx.pool,
                    ctx.stop);
}

void PipelinedPolicy::execute(const ChunkRunContext& ctx) const {
    const auto descriptors = ctx.plan.descriptors();
    std::atomic<std::size_t> fetched{0};

    ctx.progress.setState(JobState::Fetching);
    detail::runConcurrently(ctx.pool, descriptors.size(), ctx.stop, [&](std::size_t i) {
        const Chunk chunk = Chunk::fetch(descriptors[i], ctx.client, ctx.url);
        if (fetched.fetch_add(1) + 1 == descriptors.size()) {
            ctx.progress.setState(JobState::Writing);
        }
        // A sibling already failed; the job is lost, so do not commit more bytes.
        if (ctx.stop.load()) {
            return;
        }
        chunk.writeTo(ctx.file);
        ctx.onWritten(chunk.descriptor());
    });
}

std::shared_ptr<const ChunkPolicy> makePolicy(DownloadPolicy policy) {
    switch (policy) {
        case DownloadPolicy::FetchThenWrite: return std::make_shared<FetchThenWritePolicy>();
        case DownloadPolicy::FetchAndWritePipelined: return std::make_shared<PipelinedPolicy>();
    }
    return std::make_shared<PipelinedPolicy>();
}

} // namespace chunkdl
