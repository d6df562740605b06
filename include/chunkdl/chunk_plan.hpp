#pragma once

#include "chunk.hpp"
#include "http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace chunkdl {

// Deterministic tiling of [0, total_bytes) into ChunkDescriptors. The plan is
// a plain value; iterating it computes each descriptor from (start, total,
// chunk size), so walking it twice yields the same sequence.
class ChunkPlan {
public:
    // Resources below this size, or without range support, are fetched in one piece.
    static constexpr std::uint64_t kParallelThreshold = 4ULL * 1024 * 1024;

    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ChunkDescriptor;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkDescriptor*;
        using reference = const ChunkDescriptor&;

        Iterator() = default;

        reference operator*() const noexcept { return current_; }
        pointer operator->() const noexcept { return &current_; }
        Iterator& operator++() noexcept;
        Iterator operator++(int) noexcept;

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) noexcept {
            return lhs.done_ == rhs.done_ && (lhs.done_ || lhs.current_ == rhs.current_);
        }
        friend bool operator!=(const Iterator& lhs, const Iterator& rhs) noexcept { return !(lhs == rhs); }

    private:
        friend class ChunkPlan;
        Iterator(const ChunkPlan* plan, std::uint64_t start) noexcept;

        const ChunkPlan* plan_{nullptr};
        ChunkDescriptor current_{};
        bool done_{true};
    };

    // Throws std::invalid_argument when worker_count is 0.
    [[nodiscard]] static ChunkPlan plan(const ResourceMetadata& metadata, std::size_t worker_count);

    [[nodiscard]] Iterator begin() const noexcept;
    [[nodiscard]] Iterator end() const noexcept;

    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_bytes_; }
    [[nodiscard]] std::uint64_t chunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<ChunkDescriptor> descriptors() const;

private:
    ChunkPlan(std::uint64_t total_bytes, std::uint64_t chunk_size) noexcept;

    std::uint64_t total_bytes_;
    std::uint64_t chunk_size_;
};

} // namespace chunkdl
