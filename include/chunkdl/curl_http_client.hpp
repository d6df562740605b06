#pragma once

#include "http_client.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace chunkdl {

class CurlHttpClient final : public HttpClient {
public:
    struct Options {
        std::uint32_t retry{2};
        std::chrono::milliseconds retry_base_delay{200};
        std::chrono::milliseconds retry_max_delay{5000};
        long connect_timeout_sec{30};
        // Abort a transfer that stays below low_speed_limit bytes/s for low_speed_time seconds.
        long low_speed_limit{1024};
        long low_speed_time{60};
        std::string user_agent{"chunkdl/1.0"};
        bool verbose{false};
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options options);
    ~CurlHttpClient() override;

    [[nodiscard]] ResourceMetadata head(const std::string& url) override;
    [[nodiscard]] std::string getRange(const std::string& url,
                                       std::uint64_t first,
                                       std::uint64_t last) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chunkdl
