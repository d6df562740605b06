#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace chunkdl::detail {

void ensureCurlInitialized();

// "Accept-Ranges: bytes" in a raw header block, header name and value matched case-insensitively.
[[nodiscard]] bool parseAcceptRanges(std::string_view headers);

// Content-Length from a raw header block; 0 when missing or unparseable.
// With redirects the block holds several responses and the last value wins.
[[nodiscard]] std::uint64_t parseContentLength(std::string_view headers);

[[nodiscard]] bool isTransientHttpStatus(long status) noexcept;

// Backoff before retry number `attempt` (1-based): base * 2^(attempt-1), capped.
[[nodiscard]] std::chrono::milliseconds backoffDelay(std::uint32_t attempt,
                                                     std::chrono::milliseconds base,
                                                     std::chrono::milliseconds cap) noexcept;

} // namespace chunkdl::detail
