#include "chunkdl/progress_panel.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/format.h>

namespace chunkdl {

namespace {

constexpr int kBarWidth = 30;
constexpr std::size_t kNameWidth = 20;

std::string displayName(const std::string& filename) {
    std::string name = std::filesystem::path{filename}.filename().string();
    if (name.empty()) {
        name = filename;
    }
    if (name.size() > kNameWidth) {
        name.resize(kNameWidth);
    }
    return name.empty() ? "(unnamed)" : name;
}

std::string statusSuffix(const Progress& progress) {
    if (progress.state == JobState::Failed) {
        return fmt::format("  FAILED {}", progress.error_message);
    }
    if (progress.state == JobState::Done) {
        return "  done";
    }
    return fmt::format("  {}", toString(progress.state));
}

} // namespace

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

void ProgressPanel::draw(const std::vector<Progress>& tasks) {
    const std::string panel = build(tasks);
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

std::string ProgressPanel::build(const std::vector<Progress>& tasks) {
    std::string panel;
    panel.reserve(tasks.size() * 128 + 256);
    panel += fmt::format("chunkdl ({} tasks)\n", tasks.size());

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& progress : tasks) {
        panel += formatTaskLine(progress);
        panel.push_back('\n');
        total_all += progress.total_bytes;
        downloaded_all += progress.downloaded_bytes;
    }

    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("overall {:>3}% ({}/{})\n", static_cast<int>(ratio * 100.0),
                             formatSize(downloaded_all), formatSize(total_all));
    } else {
        panel += "overall N/A\n";
    }
    return panel;
}

std::string ProgressPanel::formatTaskLine(const Progress& progress) {
    const std::string name = displayName(progress.filename);

    if (progress.total_bytes == 0) {
        return fmt::format("{:<20} [{}]{}", name, std::string(kBarWidth, ' '), statusSuffix(progress));
    }

    const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                           static_cast<double>(progress.total_bytes));
    const int filled = static_cast<int>(ratio * kBarWidth);
    std::string bar(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(kBarWidth - filled), '-');

    return fmt::format("{:<20} [{}] {:>3}% ({}/{}){}", name, bar, static_cast<int>(ratio * 100.0),
                       formatSize(progress.downloaded_bytes), formatSize(progress.total_bytes),
                       statusSuffix(progress));
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= GB) {
        return fmt::format("{:.1f} GB", value / GB);
    }
    if (value >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    }
    if (value >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

} // namespace chunkdl
