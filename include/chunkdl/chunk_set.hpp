#pragma once

#include "chunk.hpp"
#include "output_file.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace chunkdl {

// Fetched chunks of one resource, kept ordered by start offset.
class ChunkSet {
public:
    using WrittenCallback = std::function<void(const ChunkDescriptor&)>;

    explicit ChunkSet(std::uint64_t total_bytes);

    void add(Chunk chunk);

    // Checks that the chunks tile [0, totalBytes()) exactly: first starts at 0,
    // each ends where the next starts, the last ends at totalBytes().
    // Throws DownloadError(IncompleteDownload) on a gap, overlap or duplicate.
    void verify() const;

    // Writes every chunk concurrently on `pool` and empties the set.
    // `on_written` runs once per chunk, after its write returned. Once `stop`
    // is raised (by a failed write or by the caller), chunks not yet written
    // are skipped; a write failure is rethrown after all writers finished.
    void writeAll(OutputFile& file, const WrittenCallback& on_written, WorkerPool& pool, std::atomic<bool>& stop);

    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_bytes_; }
    [[nodiscard]] std::size_t size() const noexcept { return chunks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return chunks_.empty(); }
    [[nodiscard]] const std::vector<Chunk>& chunks() const noexcept { return chunks_; }

private:
    std::uint64_t total_bytes_;
    std::vector<Chunk> chunks_;
};

} // namespace chunkdl
