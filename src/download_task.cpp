#include "chunkdl/download_task.hpp"

#include <stdexcept>
#include <string_view>

namespace chunkdl {

DownloadTask DownloadTask::fromUrl(const std::string& url) {
    std::string_view rest{url};

    const auto scheme = rest.find("://");
    if (scheme == std::string_view::npos || scheme == 0) {
        throw std::invalid_argument("Cannot infer filename from " + url + ": not an absolute URL");
    }
    rest.remove_prefix(scheme + 3);
    rest = rest.substr(0, rest.find_first_of("?#"));

    const auto slash = rest.find('/');
    // A trailing slash leaves an empty last segment, which names no file.
    const std::string_view path = (slash == std::string_view::npos) ? std::string_view{} : rest.substr(slash);
    const auto last = path.rfind('/');
    const std::string_view name = (last == std::string_view::npos) ? std::string_view{} : path.substr(last + 1);
    if (name.empty() || name == "." || name == "..") {
        throw std::invalid_argument("Cannot infer filename from " + url);
    }
    return DownloadTask{url, std::filesystem::path{std::string{name}}};
}

} // namespace chunkdl
