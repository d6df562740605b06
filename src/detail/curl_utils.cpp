#include "chunkdl/detail/curl_utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace chunkdl::detail {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

// Calls fn(name, value) for each "Name: value" line; status lines are skipped.
template <typename Fn>
void forEachHeader(std::string_view headers, Fn&& fn) {
    while (!headers.empty()) {
        const auto eol = headers.find('\n');
        std::string_view line = headers.substr(0, eol);
        headers = (eol == std::string_view::npos) ? std::string_view{} : headers.substr(eol + 1);

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        fn(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

bool parseAcceptRanges(std::string_view headers) {
    bool supported = false;
    forEachHeader(headers, [&](std::string_view name, std::string_view value) {
        if (equalsIgnoreCase(name, "Accept-Ranges")) {
            supported = equalsIgnoreCase(value, "bytes");
        }
    });
    return supported;
}

std::uint64_t parseContentLength(std::string_view headers) {
    std::uint64_t length = 0;
    forEachHeader(headers, [&](std::string_view name, std::string_view value) {
        if (!equalsIgnoreCase(name, "Content-Length")) {
            return;
        }
        std::uint64_t parsed = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        length = (ec == std::errc{} && ptr == value.data() + value.size()) ? parsed : 0;
    });
    return length;
}

bool isTransientHttpStatus(long status) noexcept {
    return status == 408 || status == 429 || (status >= 500 && status <= 599);
}

std::chrono::milliseconds backoffDelay(std::uint32_t attempt,
                                       std::chrono::milliseconds base,
                                       std::chrono::milliseconds cap) noexcept {
    auto delay = base;
    for (std::uint32_t i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

} // namespace chunkdl::detail
