#include "chunkdl/chunk.hpp"
#include "chunkdl/chunk_plan.hpp"
#include "chunkdl/errors.hpp"
#include "chunkdl/output_file.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>
#include <thread>
#include <vector>

using namespace chunkdl;
using chunkdl::test::TempDir;

TEST_CASE("OutputFile truncates an existing file") {
    TempDir tmp;
    const auto path = tmp.path() / "existing.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "stale contents";
    }

    OutputFile file{path};
    REQUIRE(file.size() == 0);
}

TEST_CASE("OutputFile reports creation failures as IOError") {
    TempDir tmp;
    try {
        OutputFile file{tmp.path() / "missing-dir" / "out.bin"};
        FAIL("expected IOError");
    } catch (const DownloadError& ex) {
        REQUIRE(ex.kind() == ErrorKind::IOError);
    }
}

TEST_CASE("Concurrent chunk writes reproduce the sequential file") {
    TempDir tmp;
    const std::uint64_t total = 6'000'003;
    const std::string payload = test::makePayload(total, 7);
    const auto descriptors = ChunkPlan::plan(ResourceMetadata{true, total}, 13).descriptors();
    REQUIRE(descriptors.size() > 1);

    const auto sequential_path = tmp.path() / "sequential.bin";
    {
        OutputFile file{sequential_path};
        for (const auto& d : descriptors) {
            Chunk(d, payload.substr(d.start, d.size)).writeTo(file);
        }
        file.sync();
    }

    auto shuffled = descriptors;
    std::shuffle(shuffled.begin(), shuffled.end(), std::mt19937{3});

    const auto concurrent_path = tmp.path() / "concurrent.bin";
    {
        OutputFile file{concurrent_path};
        std::vector<std::thread> writers;
        for (const auto& d : shuffled) {
            writers.emplace_back([&file, &payload, d]() {
                Chunk(d, payload.substr(d.start, d.size)).writeTo(file);
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        file.sync();
        REQUIRE(file.size() == total);
    }

    REQUIRE(test::readFile(sequential_path) == payload);
    REQUIRE(test::readFile(concurrent_path) == payload);
}
