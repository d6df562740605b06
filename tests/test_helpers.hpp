#pragma once

#include "chunkdl/errors.hpp"
#include "chunkdl/http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace chunkdl::test {

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto base = std::filesystem::temp_directory_path();
        for (;;) {
            path_ = base / ("chunkdl-test-" + std::to_string(rd()));
            if (std::filesystem::create_directory(path_)) {
                break;
            }
        }
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string makePayload(std::size_t size, std::uint32_t seed = 42) {
    std::mt19937 gen{seed};
    std::string out(size, '\0');
    for (auto& c : out) {
        c = static_cast<char>(gen() & 0xff);
    }
    return out;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// In-memory HttpClient serving fixed resources, with per-range fault injection.
class FakeHttpClient : public HttpClient {
public:
    struct Resource {
        std::string body;
        bool supports_ranges{true};
        bool report_length{true};
    };

    void add(const std::string& url, Resource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    void failHead(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_heads_.insert(url);
    }

    // The range starting at `start` returns one byte less than requested.
    void shortenRange(const std::string& url, std::uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        short_ranges_.insert({url, start});
    }

    // The range starting at `start` fails with a transport error.
    void failRange(const std::string& url, std::uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ranges_.insert({url, start});
    }

    ResourceMetadata head(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++head_calls_;
        const auto it = resources_.find(url);
        if (it == resources_.end() || failing_heads_.count(url) > 0) {
            throw DownloadError(ErrorKind::MetadataProbeFailed, url + ": HTTP status 404");
        }
        ResourceMetadata meta;
        meta.supports_ranges = it->second.supports_ranges;
        meta.total_bytes = it->second.report_length ? it->second.body.size() : 0;
        return meta;
    }

    std::string getRange(const std::string& url, std::uint64_t first, std::uint64_t last) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({first, last});
        const auto it = resources_.find(url);
        if (it == resources_.end() || failing_ranges_.count({url, first}) > 0) {
            throw DownloadError(ErrorKind::TransportError, url + ": curl error: Couldn't connect to server");
        }
        const std::string& body = it->second.body;
        if (first >= body.size() || last < first) {
            throw DownloadError(ErrorKind::TransportError, url + ": HTTP status 416");
        }
        std::string out = body.substr(first, last - first + 1);
        if (short_ranges_.count({url, first}) > 0 && !out.empty()) {
            out.pop_back();
        }
        return out;
    }

    [[nodiscard]] std::vector<std::pair<std::uint64_t, std::uint64_t>> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] int headCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return head_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::set<std::string> failing_heads_;
    std::set<std::pair<std::string, std::uint64_t>> short_ranges_;
    std::set<std::pair<std::string, std::uint64_t>> failing_ranges_;
    std::vector<std::pair<std::uint64_t, std::uint64_t>> requests_;
    int head_calls_{0};
};

} // namespace chunkdl::test
