#include "chunkdl/errors.hpp"

#include <optional>
#include <utility>

#include <fmt/format.h>

namespace chunkdl {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MetadataProbeFailed: return "MetadataProbeFailed";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::SizeMismatch: return "SizeMismatch";
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::IncompleteDownload: return "IncompleteDownload";
    }
    return "Unknown";
}

DownloadError::DownloadError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

AggregateError::AggregateError(std::string url, std::exception_ptr cause)
    : AggregateError(std::move(url), cause, describe(cause)) {}

AggregateError::AggregateError(std::string url, std::exception_ptr cause, CauseInfo info)
    : std::runtime_error(fmt::format("download of {} failed: {}", url, info.message)),
      url_(std::move(url)),
      cause_(std::move(cause)),
      cause_kind_(info.kind) {}

AggregateError::CauseInfo AggregateError::describe(const std::exception_ptr& cause) {
    CauseInfo info{"unknown failure", std::nullopt};
    if (!cause) {
        return info;
    }
    try {
        std::rethrow_exception(cause);
    } catch (const DownloadError& ex) {
        info.message = fmt::format("{}: {}", toString(ex.kind()), ex.what());
        info.kind = ex.kind();
    } catch (const std::exception& ex) {
        info.message = ex.what();
    } catch (...) {
        // Not a std::exception: nothing to describe, the cause stays available.
    }
    return info;
}

} // namespace chunkdl
