#include "chunkdl/curl_http_client.hpp"

#include "chunkdl/detail/curl_utils.hpp"
#include "chunkdl/errors.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace chunkdl {

class CurlHttpClient::Impl {
private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    // One attempt's outcome; `transient` marks failures worth another try.
    template <typename T>
    struct Attempt {
        bool ok{false};
        bool transient{false};
        std::string error;
        T value{};
    };

    template <typename Fn>
    auto withRetry(const std::string& url, ErrorKind kind, Fn&& attempt_once) const {
        for (std::uint32_t attempt = 0;; ++attempt) {
            auto result = attempt_once();
            if (result.ok) {
                return std::move(result.value);
            }
            if (!result.transient || attempt >= options_.retry) {
                throw DownloadError(kind, fmt::format("{}: {}", url, result.error));
            }
            const auto delay = detail::backoffDelay(attempt + 1, options_.retry_base_delay,
                                                    options_.retry_max_delay);
            spdlog::debug("CurlHttpClient: retry {}/{} for {} in {} ms ({})", attempt + 1,
                          options_.retry, url, delay.count(), result.error);
            std::this_thread::sleep_for(delay);
        }
    }

public:
    explicit Impl(Options options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    [[nodiscard]] ResourceMetadata head(const std::string& url) const {
        return withRetry(url, ErrorKind::MetadataProbeFailed, [&] { return probeOnce(url); });
    }

    [[nodiscard]] std::string getRange(const std::string& url,
                                       std::uint64_t first,
                                       std::uint64_t last) const {
        const std::string range = fmt::format("{}-{}", first, last);
        return withRetry(url, ErrorKind::TransportError, [&] { return getOnce(url, range, last - first + 1); });
    }

private:
    [[nodiscard]] CurlHandle newHandle(const std::string& url) const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return curl;
        }
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_sec);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.low_speed_time);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, options_.verbose ? 1L : 0L);
        return curl;
    }

    [[nodiscard]] Attempt<ResourceMetadata> probeOnce(const std::string& url) const {
        Attempt<ResourceMetadata> result;
        CurlHandle curl = newHandle(url);
        if (!curl) {
            result.error = "Failed to allocate curl handle";
            return result;
        }

        std::string headers;
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            result.transient = true;
            result.error = std::string{"curl error: "} + curl_easy_strerror(res);
            return result;
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code >= 400) {
            result.transient = detail::isTransientHttpStatus(code);
            result.error = fmt::format("HTTP status {}", code);
            return result;
        }

        result.ok = true;
        result.value.supports_ranges = detail::parseAcceptRanges(headers);
        result.value.total_bytes = detail::parseContentLength(headers);
        return result;
    }

    [[nodiscard]] Attempt<std::string> getOnce(const std::string& url,
                                               const std::string& range,
                                               std::uint64_t expected) const {
        Attempt<std::string> result;
        CurlHandle curl = newHandle(url);
        if (!curl) {
            result.error = "Failed to allocate curl handle";
            return result;
        }

        result.value.reserve(static_cast<std::size_t>(expected));
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::bodyCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.value);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            result.transient = true;
            result.error = std::string{"curl error: "} + curl_easy_strerror(res);
            result.value.clear();
            return result;
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code >= 400) {
            result.transient = detail::isTransientHttpStatus(code);
            result.error = fmt::format("HTTP status {} for range {}", code, range);
            result.value.clear();
            return result;
        }

        result.ok = true;
        return result;
    }

    static size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* out = static_cast<std::string*>(userdata);
        const size_t total = size * nmemb;
        if (!out) {
            return 0;
        }
        // Keep only the last response's headers when redirects are followed.
        if (total >= 5 && std::string_view(ptr, 5) == "HTTP/") {
            out->clear();
        }
        out->append(ptr, total);
        return total;
    }

    static size_t bodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* out = static_cast<std::string*>(userdata);
        if (!out) {
            return 0;
        }
        out->append(ptr, size * nmemb);
        return size * nmemb;
    }

    Options options_;
};

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlHttpClient::~CurlHttpClient() = default;

ResourceMetadata CurlHttpClient::head(const std::string& url) { return impl_->head(url); }

std::string CurlHttpClient::getRange(const std::string& url, std::uint64_t first, std::uint64_t last) {
    return impl_->getRange(url, first, last);
}

} // namespace chunkdl
