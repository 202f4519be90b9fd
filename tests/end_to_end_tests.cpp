// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vault/core/download_manager.hpp>
#include <vault/crypto/encryption_manager.hpp>
#include <vault/stream/streaming_server.hpp>
#include "support/file_secret_store.hpp"
#include "support/http_client.hpp"
#include "support/origin_server.hpp"
#include "support/temp_dir.hpp"
#include <filesystem>

using namespace vault;
using vault::test::http_get;
using vault::test::make_payload;
using vault::test::OriginOptions;
using vault::test::OriginServer;
using vault::test::TempDir;

namespace fs = std::filesystem;

namespace {

core::VaultConfig e2e_config(const TempDir& dir) {
    core::VaultConfig config;
    config.vault_dir = dir / "vault";
    config.disk_space_buffer_bytes = 0;
    return config;
}

std::string stem_of(const std::string& filename) {
    return fs::path(filename).stem().string();
}

} // namespace

TEST_CASE("Encrypted download streams back as plaintext", "[e2e]") {
    TempDir dir;
    const auto payload = make_payload(200'000, 21);
    OriginServer origin(payload);
    const auto config = e2e_config(dir);

    auto encryption = std::make_shared<crypto::EncryptionManager>(
        std::make_shared<test::FileSecretStore>(dir / "secrets"));
    REQUIRE(encryption->enable("vault passphrase").has_value());

    core::DownloadManager downloads(config, encryption);
    REQUIRE(downloads.initialize().has_value());

    auto metadata = downloads.download(core::DownloadRequest{"claim7", "1080p", origin.url()}, true);
    REQUIRE(metadata.has_value());
    REQUIRE(metadata->encrypted);

    auto path = downloads.content_path(metadata->filename);
    REQUIRE(path.has_value());

    stream::StreamingServer server(encryption, 2);
    const auto key = stem_of(metadata->filename);
    REQUIRE(server.register_content(key, *path, true, std::string("video/mp4")).has_value());
    auto port = server.start();
    REQUIRE(port.has_value());

    auto url = server.content_url(key);
    REQUIRE(url.has_value());
    CHECK(url->ends_with("/content/" + key));

    auto reply = http_get(*port, "/content/" + key, std::string("bytes=60000-80000"));
    CHECK(reply.status == 206);
    CHECK(reply.body.size() == 20'001);
    CHECK(reply.body == payload.substr(60'000, 20'001));
    CHECK(reply.header("content-range") == "bytes 60000-80000/200000");
    CHECK(reply.header("content-type") == "video/mp4");

    auto whole = http_get(*port, "/content/" + key);
    CHECK(whole.status == 200);
    CHECK(whole.body == payload);

    server.stop();

    // Deleting the content removes the ciphertext
    REQUIRE(downloads.delete_content("claim7", "1080p", metadata->filename).has_value());
    CHECK(!fs::exists(*path));
}

TEST_CASE("Interrupted download resumes and plays back", "[e2e]") {
    TempDir dir;
    const auto payload = make_payload(180'000, 5);
    OriginOptions flaky;
    flaky.truncate_after = 70'000;
    OriginServer origin(payload, flaky);

    core::DownloadManager downloads(e2e_config(dir), nullptr);
    const core::DownloadRequest request{"claim8", "480p", origin.url()};

    auto first = downloads.download(request, false);
    REQUIRE(!first.has_value());
    REQUIRE(first.error().recoverable());

    origin.set_options(OriginOptions{});
    auto second = downloads.download(request, false);
    REQUIRE(second.has_value());

    stream::StreamingServer server(nullptr, 2);
    auto path = downloads.content_path(second->filename);
    REQUIRE(path.has_value());
    REQUIRE(server.register_content(request.key(), *path, false).has_value());
    auto port = server.start();
    REQUIRE(port.has_value());

    auto tail = http_get(*port, "/content/claim8-480p", std::string("bytes=-1000"));
    CHECK(tail.status == 206);
    CHECK(tail.body == payload.substr(payload.size() - 1000));

    server.stop();
}
