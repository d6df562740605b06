#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkdl {

enum class ErrorKind {
    MetadataProbeFailed,
    TransportError,
    SizeMismatch,
    IOError,
    IncompleteDownload,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Batch-level failure: the first task (in submission order) that failed.
class AggregateError : public std::runtime_error {
public:
    AggregateError(std::string url, std::exception_ptr cause);

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] std::exception_ptr cause() const noexcept { return cause_; }

    // Empty when the wrapped failure was not a DownloadError.
    [[nodiscard]] std::optional<ErrorKind> causeKind() const noexcept { return cause_kind_; }

private:
    struct CauseInfo {
        std::string message;
        std::optional<ErrorKind> kind;
    };

    static CauseInfo describe(const std::exception_ptr& cause);

    AggregateError(std::string url, std::exception_ptr cause, CauseInfo info);

    std::string url_;
    std::exception_ptr cause_;
    std::optional<ErrorKind> cause_kind_;
};

} // namespace chunkdl
