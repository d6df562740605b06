#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace chunkdl {

enum class JobState {
    Pending,
    Planning,
    Fetching,
    Writing,
    Verifying,
    Done,
    Failed,
};

[[nodiscard]] std::string_view toString(JobState state) noexcept;

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    JobState state{JobState::Pending};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

// Per-task progress state. The owning job writes, renderers read snapshots
// from any thread.
class ProgressSink {
public:
    ProgressSink(std::string url, std::string filename);

    void setState(JobState state);
    void setTotal(std::uint64_t total_bytes);
    void advance(std::uint64_t bytes);
    // Keeps the first message; later failures of the same task are dropped.
    void registerError(std::string message);

    [[nodiscard]] Progress snapshot() const;
    [[nodiscard]] JobState state() const;
    [[nodiscard]] std::uint64_t downloaded() const;

private:
    mutable std::mutex state_mutex_;
    Progress progress_;
};

using ProgressSinkPtr = std::shared_ptr<ProgressSink>;

} // namespace chunkdl
