#pragma once

#include <filesystem>
#include <string>

namespace chunkdl {

struct DownloadTask {
    std::string url;
    std::filesystem::path destination;

    // Destination named after the last non-empty path segment of `url`.
    // Throws std::invalid_argument when the URL has no such segment.
    [[nodiscard]] static DownloadTask fromUrl(const std::string& url);
};

} // namespace chunkdl
