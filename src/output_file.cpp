#include "chunkdl/output_file.hpp"

#include "chunkdl/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fmt/format.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace chunkdl {

namespace {

std::string lastError() {
    return std::strerror(errno);
}

} // namespace

OutputFile::OutputFile(const std::filesystem::path& path) : path_(path) {
    file_.reset(std::fopen(path_.c_str(), "wb+"));
    if (!file_) {
        throw DownloadError(ErrorKind::IOError,
                            fmt::format("Cannot create destination file {}: {}", path_.string(), lastError()));
    }
}

OutputFile::~OutputFile() = default;

void OutputFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    FILE* file = file_.get();

    if (fseeko(file, static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw DownloadError(ErrorKind::IOError,
                            fmt::format("Failed to seek {} to offset {}: {}", path_.string(), offset, lastError()));
    }
    if (size == 0) {
        return;
    }

    const size_t written = std::fwrite(data, 1, size, file);
    if (written != size) {
        throw DownloadError(ErrorKind::IOError,
                            fmt::format("Failed to write {} bytes at offset {} of {}: {}", size, offset,
                                        path_.string(), lastError()));
    }
}

void OutputFile::sync() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (std::fflush(file_.get()) != 0 || fsync(fileno(file_.get())) != 0) {
        throw DownloadError(ErrorKind::IOError,
                            fmt::format("Failed to sync {}: {}", path_.string(), lastError()));
    }
}

std::uint64_t OutputFile::size() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (std::fflush(file_.get()) != 0) {
        throw DownloadError(ErrorKind::IOError,
                            fmt::format("Failed to flush {}: {}", path_.string(), lastError()));
    }

    struct stat info {};
    if (fstat(fileno(file_.get()), &info) != 0) {
        throw DownloadError(ErrorKind::IOError,
                            fmt::format("Failed to stat {}: {}", path_.string(), lastError()));
    }
    return static_cast<std::uint64_t>(info.st_size);
}

} // namespace chunkdl
