#include "chunkdl/download_engine.hpp"
#include "chunkdl/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chunkdl;
using chunkdl::test::FakeHttpClient;
using chunkdl::test::TempDir;

namespace {

EngineOptions optionsFor(const TempDir& tmp, DownloadPolicy policy = DownloadPolicy::FetchAndWritePipelined) {
    EngineOptions options;
    options.directory = tmp.path();
    options.policy = policy;
    return options;
}

} // namespace

TEST_CASE("DownloadEngine downloads every task into the target directory") {
    const auto policy = GENERATE(DownloadPolicy::FetchAndWritePipelined, DownloadPolicy::FetchThenWrite);
    TempDir tmp;
    auto client = std::make_shared<FakeHttpClient>();

    const std::string big = test::makePayload(9'000'000, 1);
    const std::string small = test::makePayload(4096, 2);
    const std::string plain = test::makePayload(6'000'000, 3);
    client->add("http://a.example/big.bin", {big});
    client->add("http://b.example/small.bin", {small});
    client->add("http://c.example/plain.bin", {plain, false});

    DownloadEngine engine{optionsFor(tmp, policy), client};
    engine.run({
        {"http://a.example/big.bin", "big.bin"},
        {"http://b.example/small.bin", "small.bin"},
        {"http://c.example/plain.bin", "plain.bin"},
    });

    REQUIRE(test::readFile(tmp.path() / "big.bin") == big);
    REQUIRE(test::readFile(tmp.path() / "small.bin") == small);
    REQUIRE(test::readFile(tmp.path() / "plain.bin") == plain);

    const auto progress = engine.progress();
    REQUIRE(progress.size() == 3);
    for (const auto& p : progress) {
        REQUIRE(p.state == JobState::Done);
        REQUIRE(p.downloaded_bytes == p.total_bytes);
    }
    REQUIRE(progress[0].total_bytes == 9'000'000);

    const auto results = engine.results();
    REQUIRE(results.size() == 3);
    for (const auto& r : results) {
        REQUIRE(r.ok());
    }
    REQUIRE(results[1].task.destination.string() == (tmp.path() / "small.bin").string());
}

TEST_CASE("DownloadEngine surfaces the first failed task and lets the others finish") {
    TempDir tmp;
    auto client = std::make_shared<FakeHttpClient>();

    const std::string good = test::makePayload(5'000'000, 5);
    client->add("http://example.com/good.bin", {good});
    client->add("http://example.com/short.bin", {test::makePayload(1000, 6)});
    client->shortenRange("http://example.com/short.bin", 0);

    DownloadEngine engine{optionsFor(tmp), client};
    try {
        engine.run({
            {"http://example.com/missing.bin", "missing.bin"},
            {"http://example.com/good.bin", "good.bin"},
            {"http://example.com/short.bin", "short.bin"},
        });
        FAIL("expected AggregateError");
    } catch (const AggregateError& ex) {
        REQUIRE(ex.url() == "http://example.com/missing.bin");
        REQUIRE(ex.causeKind() == ErrorKind::MetadataProbeFailed);
        REQUIRE_THAT(ex.what(), Catch::Contains("MetadataProbeFailed"));
        REQUIRE_THROWS_AS(std::rethrow_exception(ex.cause()), DownloadError);
    }

    REQUIRE(test::readFile(tmp.path() / "good.bin") == good);

    const auto results = engine.results();
    REQUIRE(results.size() == 3);
    REQUIRE_FALSE(results[0].ok());
    REQUIRE(results[1].ok());
    REQUIRE_FALSE(results[2].ok());

    const auto progress = engine.progress();
    REQUIRE(progress[0].state == JobState::Failed);
    REQUIRE(progress[1].state == JobState::Done);
    REQUIRE(progress[2].state == JobState::Failed);
    REQUIRE(progress[2].has_error);
}

TEST_CASE("DownloadEngine with no tasks succeeds") {
    TempDir tmp;
    DownloadEngine engine{optionsFor(tmp), std::make_shared<FakeHttpClient>()};
    REQUIRE_NOTHROW(engine.run({}));
    REQUIRE(engine.progress().empty());
    REQUIRE(engine.results().empty());
}

TEST_CASE("DownloadEngine validates its options") {
    TempDir tmp;
    auto options = optionsFor(tmp);
    options.workers = 0;
    REQUIRE_THROWS_AS(DownloadEngine(options, std::make_shared<FakeHttpClient>()), std::invalid_argument);
    REQUIRE_THROWS_AS(DownloadEngine(optionsFor(tmp), nullptr), std::invalid_argument);

    options = optionsFor(tmp);
    options.max_active_tasks = 0;
    REQUIRE_THROWS_AS(DownloadEngine(options, std::make_shared<FakeHttpClient>()), std::invalid_argument);

    options = optionsFor(tmp);
    options.pool_threads = 0;
    REQUIRE_THROWS_AS(DownloadEngine(options, std::make_shared<FakeHttpClient>()), std::invalid_argument);
}

TEST_CASE("DownloadEngine runs more tasks than it has threads") {
    TempDir tmp;
    auto client = std::make_shared<FakeHttpClient>();
    auto options = optionsFor(tmp);
    options.max_active_tasks = 1;
    options.pool_threads = 1;

    std::vector<DownloadTask> tasks;
    std::vector<std::string> payloads;
    for (int i = 0; i < 5; ++i) {
        const std::string url = "http://example.com/part" + std::to_string(i) + ".bin";
        payloads.push_back(test::makePayload(5'000'000, static_cast<unsigned>(20 + i)));
        client->add(url, {payloads.back()});
        tasks.push_back({url, "part" + std::to_string(i) + ".bin"});
    }

    DownloadEngine engine{options, client};
    engine.run(tasks);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(test::readFile(tmp.path() / ("part" + std::to_string(i) + ".bin")) == payloads[i]);
    }
    for (const auto& p : engine.progress()) {
        REQUIRE(p.state == JobState::Done);
    }
}

TEST_CASE("EngineOptions defaults") {
    const EngineOptions options;
    REQUIRE(options.workers == 4);
    REQUIRE(options.max_active_tasks == 4);
    REQUIRE(options.pool_threads == 16);
    REQUIRE(options.retry == 2);
    REQUIRE(options.directory.string() == ".");
    REQUIRE(options.policy == DownloadPolicy::FetchAndWritePipelined);
}
