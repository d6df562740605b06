#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace chunkdl {

struct ResourceMetadata {
    bool supports_ranges{false};
    std::uint64_t total_bytes{0};   // 0 when the server did not report a usable length
};

// Transport capability consumed by the download core. Implementations own
// their retry policy and must accept concurrent calls from several threads.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // HEAD probe. Throws DownloadError(MetadataProbeFailed).
    [[nodiscard]] virtual ResourceMetadata head(const std::string& url) = 0;

    // GET with "Range: bytes=<first>-<last>" (inclusive). Returns the raw body.
    // Throws DownloadError(TransportError).
    [[nodiscard]] virtual std::string getRange(const std::string& url,
                                               std::uint64_t first,
                                               std::uint64_t last) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace chunkdl
