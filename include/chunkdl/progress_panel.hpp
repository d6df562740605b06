#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace chunkdl {

// Terminal rendering of DownloadEngine::progress() snapshots. Each draw
// replaces the previous panel in place with ANSI cursor movement.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out);

    void draw(const std::vector<Progress>& tasks);

    [[nodiscard]] static std::string build(const std::vector<Progress>& tasks);
    [[nodiscard]] static std::string formatTaskLine(const Progress& progress);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace chunkdl
