// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vault/stream/registry.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace vault::stream;

namespace {

StreamRegistration entry(std::string key, bool encrypted, std::uint64_t size) {
    StreamRegistration r;
    r.key = std::move(key);
    r.file_path = "/vault/" + r.key;
    r.encrypted = encrypted;
    r.content_type = "video/mp4";
    r.file_size = size;
    return r;
}

} // namespace

TEST_CASE("guess_content_type", "[registry]") {
    CHECK(guess_content_type("a/b/claim-720p.mp4") == "video/mp4");
    CHECK(guess_content_type("clip.WEBM") == "video/webm");
    CHECK(guess_content_type("clip.mkv") == "video/x-matroska");
    CHECK(guess_content_type("song.mp3") == "audio/mpeg");
    CHECK(guess_content_type("0123abcd.bin") == "application/octet-stream");
    CHECK(guess_content_type("noextension") == "application/octet-stream");
}

TEST_CASE("StreamRegistry basic operations", "[registry]") {
    StreamRegistry registry;
    CHECK(registry.size() == 0);
    CHECK(!registry.find("missing").has_value());

    registry.insert(entry("a-720p", false, 100));
    registry.insert(entry("b-1080p", true, 250));

    auto found = registry.find("a-720p");
    REQUIRE(found.has_value());
    CHECK(found->file_size == 100);
    CHECK(!found->encrypted);

    SECTION("Insert replaces an existing key") {
        registry.insert(entry("a-720p", false, 999));
        CHECK(registry.size() == 2);
        CHECK(registry.find("a-720p")->file_size == 999);
    }

    SECTION("Remove") {
        CHECK(registry.remove("a-720p"));
        CHECK(!registry.remove("a-720p"));
        CHECK(registry.size() == 1);
    }

    SECTION("Summary") {
        auto s = registry.summary();
        CHECK(s.active_streams == 2);
        CHECK(s.encrypted_streams == 1);
        CHECK(s.unencrypted_streams == 1);
        CHECK(s.total_content_size_bytes == 350);
    }

    SECTION("Clear") {
        registry.clear();
        CHECK(registry.size() == 0);
        CHECK(registry.summary().total_content_size_bytes == 0);
    }
}

TEST_CASE("StreamRegistry concurrent readers and writers", "[registry]") {
    StreamRegistry registry;
    registry.insert(entry("stable", false, 1));

    std::atomic<int> misses{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, &misses, t] {
            for (int i = 0; i < 500; ++i) {
                auto key = "k" + std::to_string(t) + "-" + std::to_string(i);
                registry.insert(entry(key, i % 2 == 0, 1));
                if (!registry.find("stable")) ++misses;
                registry.remove(key);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(misses == 0);
    CHECK(registry.size() == 1);
}
