#include "chunkdl/progress.hpp"

#include <utility>

namespace chunkdl {

std::string_view toString(JobState state) noexcept {
    switch (state) {
        case JobState::Pending: return "Pending";
        case JobState::Planning: return "Planning";
        case JobState::Fetching: return "Fetching";
        case JobState::Writing: return "Writing";
        case JobState::Verifying: return "Verifying";
        case JobState::Done: return "Done";
        case JobState::Failed: return "Failed";
    }
    return "Unknown";
}

ProgressSink::ProgressSink(std::string url, std::string filename) {
    progress_.url = std::move(url);
    progress_.filename = std::move(filename);
}

void ProgressSink::setState(JobState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress_.state = state;
    progress_.is_running = state != JobState::Pending && state != JobState::Done && state != JobState::Failed;
    if (state == JobState::Failed) {
        progress_.has_error = true;
    }
}

void ProgressSink::setTotal(std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress_.total_bytes = total_bytes;
}

void ProgressSink::advance(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress_.downloaded_bytes += bytes;
}

void ProgressSink::registerError(std::string message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress_.has_error = true;
    if (progress_.error_message.empty()) {
        progress_.error_message = std::move(message);
    }
}

Progress ProgressSink::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return progress_;
}

JobState ProgressSink::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return progress_.state;
}

std::uint64_t ProgressSink::downloaded() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return progress_.downloaded_bytes;
}

} // namespace chunkdl
