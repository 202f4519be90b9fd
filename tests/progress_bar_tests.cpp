// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vault/cli/progress_bar.hpp>
#include <sstream>

using namespace vault::cli;

TEST_CASE("ProgressBar formatting", "[cli]") {
    SECTION("Bytes") {
        CHECK(ProgressBar::format_bytes(0) == "0 B");
        CHECK(ProgressBar::format_bytes(1023) == "1023 B");
        CHECK(ProgressBar::format_bytes(1024) == "1 KB");
        CHECK(ProgressBar::format_bytes(1536 * 1024) == "1.5 MB");
        CHECK(ProgressBar::format_bytes(3ull * 1024 * 1024 * 1024) == "3.00 GB");
        CHECK(ProgressBar::format_bytes(2ull * 1024 * 1024 * 1024 * 1024) == "2.00 TB");
    }

    SECTION("Speed") {
        CHECK(ProgressBar::format_speed(512) == "512 B/s");
        CHECK(ProgressBar::format_speed(1024) == "1.0 KB/s");
        CHECK(ProgressBar::format_speed(5 * 1024 * 1024) == "5.0 MB/s");
        CHECK(ProgressBar::format_speed(1024ull * 1024 * 1024) == "1.0 GB/s");
    }

    SECTION("Time") {
        CHECK(ProgressBar::format_time(0) == "0s");
        CHECK(ProgressBar::format_time(59) == "59s");
        CHECK(ProgressBar::format_time(61) == "1m 1s");
        CHECK(ProgressBar::format_time(3600 + 5 * 60 + 7) == "1h 05m 07s");
    }
}

TEST_CASE("ProgressBar drawing", "[cli]") {
    std::ostringstream out;
    ProgressBar bar(out, 1000, "claim-720p");

    SECTION("Unknown total draws nothing") {
        ProgressBar empty(out, 0);
        empty.update(500);
        CHECK(out.str().empty());
    }

    SECTION("Redraws once per percent") {
        bar.update(500, 100);
        const auto first = out.str();
        CHECK(first.find("claim-720p: ") != std::string::npos);
        CHECK(first.find(" 50%") != std::string::npos);
        CHECK(first.find("ETA: 5s") != std::string::npos);

        bar.update(501, 100);
        CHECK(out.str() == first);
    }

    SECTION("finish draws 100% once") {
        bar.update(10);
        bar.finish();
        const auto done = out.str();
        CHECK(done.find("100%") != std::string::npos);
        CHECK(done.back() == '\n');

        bar.finish();
        CHECK(out.str() == done);
    }

    SECTION("reset rearms the bar") {
        bar.finish();
        bar.reset(2000, "other");
        CHECK(bar.total() == 2000);
        CHECK(bar.label() == "other");
        out.str("");
        bar.update(1000);
        CHECK(out.str().find("other: ") != std::string::npos);
        CHECK(out.str().find(" 50%") != std::string::npos);
    }
}

TEST_CASE("ProgressEventSink", "[cli]") {
    std::ostringstream out;
    ProgressEventSink sink(out);
    vault::core::DownloadRequest request{"claim", "720p", "https://cdn.example.com/v.mp4"};

    SECTION("Known size draws a bar") {
        sink.on_download_started(request, 0, 1000);
        vault::core::DownloadProgress progress;
        progress.bytes_written = 250;
        progress.total_bytes = 1000;
        sink.on_download_progress(progress);
        CHECK(out.str().find("claim-720p: ") != std::string::npos);
        CHECK(out.str().find(" 25%") != std::string::npos);
    }

    SECTION("Unknown size spins") {
        sink.on_download_started(request, 0, std::nullopt);
        vault::core::DownloadProgress progress;
        progress.bytes_written = 2048;
        sink.on_download_progress(progress);
        CHECK(out.str().find("2 KB") != std::string::npos);
        CHECK(out.str().find('%') == std::string::npos);
    }
}
