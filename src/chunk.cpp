#include "chunkdl/chunk.hpp"

#include "chunkdl/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace chunkdl {

Chunk Chunk::fetch(const ChunkDescriptor& descriptor, HttpClient& client, const std::string& url) {
    if (descriptor.size == 0) {
        return Chunk{descriptor, std::string{}};
    }

    std::string body = client.getRange(url, descriptor.start, descriptor.end() - 1);
    if (body.size() != descriptor.size) {
        throw DownloadError(ErrorKind::SizeMismatch,
                            fmt::format("Expected {} bytes at offset {} of {}, got {}", descriptor.size,
                                        descriptor.start, url, body.size()));
    }
    return Chunk{descriptor, std::move(body)};
}

Chunk::Chunk(ChunkDescriptor descriptor, std::string data)
    : descriptor_(descriptor), data_(std::move(data)) {
    if (data_.size() != descriptor_.size) {
        throw DownloadError(ErrorKind::SizeMismatch,
                            fmt::format("Chunk at offset {} expects {} bytes, payload has {}", descriptor_.start,
                                        descriptor_.size, data_.size()));
    }
}

void Chunk::writeTo(OutputFile& file) const {
    file.writeAt(descriptor_.start, data_.data(), data_.size());
}

} // namespace chunkdl
