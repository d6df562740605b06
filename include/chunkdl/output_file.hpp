#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>

namespace chunkdl {

// Output file shared by the concurrent chunk writers of one resource.
// Writers only get "write these bytes at this offset"; the lock covers one
// seek+write pair, so writers of disjoint ranges never wait on each other's
// network I/O.
class OutputFile {
public:
    // Creates or truncates `path`. Throws DownloadError(IOError).
    explicit OutputFile(const std::filesystem::path& path);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void writeAt(std::uint64_t offset, const char* data, std::size_t size);

    // Flushes stdio buffers and fsyncs. Throws DownloadError(IOError).
    void sync();

    // Size of the file on disk, as reported by fstat after a flush.
    [[nodiscard]] std::uint64_t size();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::filesystem::path path_;
    std::unique_ptr<FILE, FileDeleter> file_;
    std::mutex file_mutex_;
};

using OutputFilePtr = std::shared_ptr<OutputFile>;

} // namespace chunkdl
