#include "chunkdl/chunk_set.hpp"

#include "chunkdl/detail/parallel.hpp"
#include "chunkdl/errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace chunkdl {

ChunkSet::ChunkSet(std::uint64_t total_bytes) : total_bytes_(total_bytes) {}

void ChunkSet::add(Chunk chunk) {
    const auto pos = std::upper_bound(chunks_.begin(), chunks_.end(), chunk.start(),
                                      [](std::uint64_t start, const Chunk& c) { return start < c.start(); });
    chunks_.insert(pos, std::move(chunk));
}

void ChunkSet::verify() const {
    if (chunks_.empty()) {
        throw DownloadError(ErrorKind::IncompleteDownload, "Incomplete chunk set: no chunks");
    }
    if (chunks_.front().start() != 0) {
        throw DownloadError(ErrorKind::IncompleteDownload,
                            fmt::format("Incomplete chunk set: first chunk starts at {}", chunks_.front().start()));
    }

    for (std::size_t i = 1; i < chunks_.size(); ++i) {
        const auto& prev = chunks_[i - 1].descriptor();
        const auto& next = chunks_[i].descriptor();
        if (prev.end() != next.start) {
            throw DownloadError(ErrorKind::IncompleteDownload,
                                fmt::format("Incomplete chunk set: chunk ending at {} followed by chunk at {}",
                                            prev.end(), next.start));
        }
    }

    const auto last_end = chunks_.back().descriptor().end();
    if (last_end != total_bytes_) {
        throw DownloadError(ErrorKind::IncompleteDownload,
                            fmt::format("Incomplete chunk set: covers {} of {} bytes", last_end, total_bytes_));
    }
}

void ChunkSet::writeAll(OutputFile& file, const WrittenCallback& on_written, WorkerPool& pool,
                        std::atomic<bool>& stop) {
    std::vector<Chunk> pending = std::move(chunks_);
    chunks_.clear();

    detail::runConcurrently(pool, pending.size(), stop, [&](std::size_t i) {
        const Chunk chunk = std::move(pending[i]);
        chunk.writeTo(file);
        if (on_written) {
            on_written(chunk.descriptor());
        }
    });
}

} // namespace chunkdl
