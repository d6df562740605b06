#include "chunkdl/chunk_plan.hpp"

#include <algorithm>
#include <stdexcept>

namespace chunkdl {

namespace {

// ceil(total / parts) without the overflow of (total + parts - 1).
std::uint64_t ceilDiv(std::uint64_t total, std::uint64_t parts) noexcept {
    return total / parts + (total % parts != 0 ? 1 : 0);
}

} // namespace

ChunkPlan::ChunkPlan(std::uint64_t total_bytes, std::uint64_t chunk_size) noexcept
    : total_bytes_(total_bytes), chunk_size_(chunk_size) {}

ChunkPlan ChunkPlan::plan(const ResourceMetadata& metadata, std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("ChunkPlan: worker count must be at least 1");
    }

    const std::uint64_t total = metadata.total_bytes;
    if (!metadata.supports_ranges || total < kParallelThreshold) {
        return ChunkPlan{total, total};
    }

    return ChunkPlan{total, ceilDiv(total, worker_count)};
}

ChunkPlan::Iterator ChunkPlan::begin() const noexcept {
    return Iterator{this, 0};
}

ChunkPlan::Iterator ChunkPlan::end() const noexcept {
    return Iterator{};
}

std::size_t ChunkPlan::size() const noexcept {
    if (total_bytes_ == 0) {
        return 1;
    }
    return static_cast<std::size_t>(ceilDiv(total_bytes_, chunk_size_));
}

std::vector<ChunkDescriptor> ChunkPlan::descriptors() const {
    std::vector<ChunkDescriptor> out;
    out.reserve(size());
    std::copy(begin(), end(), std::back_inserter(out));
    return out;
}

ChunkPlan::Iterator::Iterator(const ChunkPlan* plan, std::uint64_t start) noexcept
    : plan_(plan), done_(false) {
    current_.start = start;
    current_.size = std::min(plan_->chunk_size_, plan_->total_bytes_ - start);
}

ChunkPlan::Iterator& ChunkPlan::Iterator::operator++() noexcept {
    if (done_) {
        return *this;
    }
    const std::uint64_t next = current_.end();
    // An empty resource still produces its single empty descriptor, then stops.
    if (next >= plan_->total_bytes_) {
        done_ = true;
        current_ = ChunkDescriptor{};
        return *this;
    }
    current_.start = next;
    current_.size = std::min(plan_->chunk_size_, plan_->total_bytes_ - next);
    return *this;
}

ChunkPlan::Iterator ChunkPlan::Iterator::operator++(int) noexcept {
    Iterator previous = *this;
    ++*this;
    return previous;
}

} // namespace chunkdl
