#include "chunkdl/download_task.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using chunkdl::DownloadTask;

TEST_CASE("DownloadTask::fromUrl takes the last path segment") {
    const auto task = DownloadTask::fromUrl("https://example.com/media/files/track01.mp3");
    REQUIRE(task.url == "https://example.com/media/files/track01.mp3");
    REQUIRE(task.destination.string() == "track01.mp3");

    REQUIRE(DownloadTask::fromUrl("https://example.com/a/b.tar.gz?token=1#frag").destination.string() == "b.tar.gz");
}

TEST_CASE("DownloadTask::fromUrl rejects URLs without a file name") {
    REQUIRE_THROWS_AS(DownloadTask::fromUrl("https://example.com"), std::invalid_argument);
    REQUIRE_THROWS_AS(DownloadTask::fromUrl("https://example.com/"), std::invalid_argument);
    REQUIRE_THROWS_AS(DownloadTask::fromUrl("https://example.com/dir/name/"), std::invalid_argument);
    REQUIRE_THROWS_AS(DownloadTask::fromUrl("https://example.com/dir//?q=1"), std::invalid_argument);
    REQUIRE_THROWS_AS(DownloadTask::fromUrl("not a url"), std::invalid_argument);
}
