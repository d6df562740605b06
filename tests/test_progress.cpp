#include "chunkdl/download_policy.hpp"
#include "chunkdl/progress.hpp"
#include "chunkdl/progress_panel.hpp"

#include <catch2/catch.hpp>

#include <sstream>

using namespace chunkdl;

TEST_CASE("ProgressSink tracks state and keeps the first error") {
    ProgressSink sink{"http://example.com/f.bin", "/tmp/f.bin"};
    REQUIRE(sink.state() == JobState::Pending);
    REQUIRE_FALSE(sink.snapshot().is_running);

    sink.setState(JobState::Fetching);
    sink.setTotal(300);
    sink.advance(100);
    sink.advance(200);

    auto snapshot = sink.snapshot();
    REQUIRE(snapshot.is_running);
    REQUIRE(snapshot.downloaded_bytes == 300);
    REQUIRE(snapshot.total_bytes == 300);

    sink.registerError("first");
    sink.registerError("second");
    sink.setState(JobState::Failed);
    snapshot = sink.snapshot();
    REQUIRE(snapshot.has_error);
    REQUIRE_FALSE(snapshot.is_running);
    REQUIRE(snapshot.error_message == "first");
}

TEST_CASE("ProgressPanel formatting") {
    REQUIRE(ProgressPanel::formatSize(512) == "512 B");
    REQUIRE(ProgressPanel::formatSize(2048) == "2.0 KB");
    REQUIRE(ProgressPanel::formatSize(10'000'000) == "9.5 MB");

    Progress p;
    p.filename = "/downloads/a-very-long-file-name-indeed.iso";
    p.total_bytes = 1000;
    p.downloaded_bytes = 500;
    p.state = JobState::Fetching;
    const auto line = ProgressPanel::formatTaskLine(p);
    REQUIRE_THAT(line, Catch::StartsWith("a-very-long-file-nam "));
    REQUIRE_THAT(line, Catch::Contains(" 50%"));
    REQUIRE_THAT(line, Catch::Contains("Fetching"));

    p.state = JobState::Failed;
    p.error_message = "IncompleteDownload";
    REQUIRE_THAT(ProgressPanel::formatTaskLine(p), Catch::Contains("FAILED IncompleteDownload"));

    std::ostringstream out;
    ProgressPanel panel{out};
    panel.draw({p});
    REQUIRE_THAT(out.str(), Catch::Contains("chunkdl (1 tasks)"));
}

TEST_CASE("DownloadPolicy names round-trip through the parser") {
    REQUIRE(parseDownloadPolicy("pipelined") == DownloadPolicy::FetchAndWritePipelined);
    REQUIRE(parseDownloadPolicy("fetch-then-write") == DownloadPolicy::FetchThenWrite);
    REQUIRE_FALSE(parseDownloadPolicy("sequential").has_value());
    REQUIRE(makePolicy(DownloadPolicy::FetchThenWrite)->kind() == DownloadPolicy::FetchThenWrite);
    REQUIRE(makePolicy(DownloadPolicy::FetchAndWritePipelined)->kind() == DownloadPolicy::FetchAndWritePipelined);
}
