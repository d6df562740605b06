#pragma once

#include "http_client.hpp"
#include "output_file.hpp"

#include <cstdint>
#include <string>

namespace chunkdl {

struct ChunkDescriptor {
    std::uint64_t start{0};
    std::uint64_t size{0};

    [[nodiscard]] std::uint64_t end() const noexcept { return start + size; }

    friend bool operator==(const ChunkDescriptor& lhs, const ChunkDescriptor& rhs) noexcept {
        return lhs.start == rhs.start && lhs.size == rhs.size;
    }
    friend bool operator!=(const ChunkDescriptor& lhs, const ChunkDescriptor& rhs) noexcept {
        return !(lhs == rhs);
    }
};

// A fetched range. The payload always holds exactly descriptor().size bytes.
class Chunk {
public:
    // Single ranged GET for `descriptor`. Throws DownloadError(TransportError)
    // when the request fails and DownloadError(SizeMismatch) when the body
    // length differs from the requested size. A zero-size descriptor yields
    // an empty chunk without touching the network.
    [[nodiscard]] static Chunk fetch(const ChunkDescriptor& descriptor,
                                     HttpClient& client,
                                     const std::string& url);

    // Throws DownloadError(SizeMismatch) when data.size() != descriptor.size.
    Chunk(ChunkDescriptor descriptor, std::string data);

    // Throws DownloadError(IOError).
    void writeTo(OutputFile& file) const;

    [[nodiscard]] const ChunkDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] std::uint64_t start() const noexcept { return descriptor_.start; }
    [[nodiscard]] std::uint64_t size() const noexcept { return descriptor_.size; }
    [[nodiscard]] const std::string& data() const noexcept { return data_; }

private:
    ChunkDescriptor descriptor_;
    std::string data_;
};

} // namespace chunkdl
