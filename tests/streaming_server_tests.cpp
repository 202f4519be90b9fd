// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vault/crypto/encryption_manager.hpp>
#include <vault/stream/streaming_server.hpp>
#include "support/file_secret_store.hpp"
#include "support/http_client.hpp"
#include "support/temp_dir.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace vault::stream;
using vault::core::VaultErrc;
using vault::crypto::EncryptionManager;
using vault::test::FileSecretStore;
using vault::test::http_get;
using vault::test::http_request;
using vault::test::make_payload;
using vault::test::TempDir;
using vault::test::write_file;

namespace http = boost::beast::http;
namespace fs = std::filesystem;

namespace {

class ServerEvents final : public vault::core::EventSink {
public:
    void on_server_started(std::uint16_t p, const std::string& url) override {
        port = p;
        base_url = url;
    }
    std::atomic<std::uint16_t> port{0};
    std::string base_url;
};

std::string body_of(const Response& res) {
    return std::string(res.body().begin(), res.body().end());
}

Request make_request(http::verb method, std::string target, std::string range = {}) {
    Request req{method, target, 11};
    if (!range.empty()) {
        req.set(http::field::range, range);
    }
    return req;
}

} // namespace

TEST_CASE("StreamingServer lifecycle", "[server]") {
    auto events = std::make_shared<ServerEvents>();
    StreamingServer server(nullptr, 2, events);

    CHECK(!server.is_running());
    auto stopped_url = server.content_url("abc");
    REQUIRE(!stopped_url.has_value());
    CHECK(stopped_url.error().is(VaultErrc::server_error));

    auto port = server.start();
    REQUIRE(port.has_value());
    CHECK(*port != 0);
    CHECK(server.is_running());
    CHECK(server.port() == *port);
    CHECK(events->port == *port);
    CHECK(events->base_url == "http://127.0.0.1:" + std::to_string(*port));

    SECTION("start is idempotent") {
        auto again = server.start();
        REQUIRE(again.has_value());
        CHECK(*again == *port);
    }

    SECTION("content_url") {
        auto url = server.content_url("claim-720p");
        REQUIRE(url.has_value());
        CHECK(*url == "http://127.0.0.1:" + std::to_string(*port) + "/content/claim-720p");
    }

    SECTION("status") {
        auto status = server.status();
        CHECK(status.running);
        CHECK(status.port == *port);
        CHECK(status.active_streams == 0);
    }

    SECTION("stop and restart") {
        server.stop();
        CHECK(!server.is_running());
        CHECK(server.port() == 0);
        CHECK(!server.content_url("x").has_value());
        server.stop();

        auto restarted = server.start();
        REQUIRE(restarted.has_value());
        auto reply = http_get(*restarted, "/health");
        CHECK(reply.status == 200);
    }

    server.stop();
}

TEST_CASE("StreamingServer plaintext content over HTTP", "[server]") {
    TempDir dir;
    const auto payload = make_payload(100'000);
    write_file(dir / "claim-720p.mp4", payload);

    StreamingServer server(nullptr, 2);
    REQUIRE(server.register_content("claim-720p", dir / "claim-720p.mp4", false).has_value());
    auto port = server.start();
    REQUIRE(port.has_value());

    SECTION("Whole resource without Range") {
        auto reply = http_get(*port, "/content/claim-720p");
        CHECK(reply.status == 200);
        CHECK(reply.body == payload);
        CHECK(reply.header("content-length") == "100000");
        CHECK(reply.header("content-type") == "video/mp4");
        CHECK(reply.header("accept-ranges") == "bytes");
        CHECK(reply.header("access-control-allow-origin") == "*");
        CHECK(reply.header("cache-control") == "no-cache");
        CHECK(!reply.has_header("content-range"));
    }

    SECTION("Single byte") {
        auto reply = http_get(*port, "/content/claim-720p", "bytes=0-0");
        CHECK(reply.status == 206);
        CHECK(reply.body == payload.substr(0, 1));
        CHECK(reply.header("content-range") == "bytes 0-0/100000");
        CHECK(reply.header("content-length") == "1");
    }

    SECTION("Open-ended range") {
        auto reply = http_get(*port, "/content/claim-720p", "bytes=99000-");
        CHECK(reply.status == 206);
        CHECK(reply.body == payload.substr(99'000));
        CHECK(reply.header("content-range") == "bytes 99000-99999/100000");
    }

    SECTION("Suffix range") {
        auto reply = http_get(*port, "/content/claim-720p", "bytes=-500");
        CHECK(reply.status == 206);
        CHECK(reply.body == payload.substr(99'500));
        CHECK(reply.header("content-range") == "bytes 99500-99999/100000");
    }

    SECTION("End past EOF is clamped") {
        auto reply = http_get(*port, "/content/claim-720p", "bytes=90000-500000");
        CHECK(reply.status == 206);
        CHECK(reply.body.size() == 10'000);
        CHECK(reply.header("content-range") == "bytes 90000-99999/100000");
    }

    SECTION("Full explicit range is a 200") {
        auto reply = http_get(*port, "/content/claim-720p", "bytes=0-99999");
        CHECK(reply.status == 200);
        CHECK(reply.body == payload);
    }

    SECTION("Start at the size is unsatisfiable") {
        auto reply = http_get(*port, "/content/claim-720p", "bytes=100000-");
        CHECK(reply.status == 416);
        CHECK(reply.header("content-range") == "bytes */100000");
    }

    SECTION("Malformed range is unsatisfiable") {
        auto reply = http_get(*port, "/content/claim-720p", "items=0-5");
        CHECK(reply.status == 416);
    }

    SECTION("HEAD reports the length without a body") {
        auto reply = http_request(*port, http::verb::head, "/content/claim-720p");
        CHECK(reply.status == 200);
        CHECK(reply.header("content-length") == "100000");
        CHECK(reply.body.empty());

        auto ranged = http_request(*port, http::verb::head, "/content/claim-720p", std::string("bytes=10-19"));
        CHECK(ranged.status == 206);
        CHECK(ranged.header("content-length") == "10");
        CHECK(ranged.header("content-range") == "bytes 10-19/100000");
    }

    SECTION("OPTIONS preflight") {
        auto reply = http_request(*port, http::verb::options, "/content/claim-720p");
        CHECK(reply.status == 204);
        CHECK(reply.header("access-control-allow-methods") == "GET, HEAD, OPTIONS");
        CHECK(reply.header("access-control-allow-headers") == "Range");
    }

    SECTION("Other methods are rejected") {
        auto reply = http_request(*port, http::verb::post, "/content/claim-720p");
        CHECK(reply.status == 405);
        CHECK(reply.header("allow") == "GET, HEAD, OPTIONS");
    }

    SECTION("Unknown key and path") {
        CHECK(http_get(*port, "/content/other").status == 404);
        CHECK(http_get(*port, "/content/").status == 404);
        CHECK(http_get(*port, "/elsewhere").status == 404);
    }

    SECTION("Unregistered content is gone") {
        CHECK(server.unregister_content("claim-720p"));
        CHECK(!server.unregister_content("claim-720p"));
        CHECK(http_get(*port, "/content/claim-720p").status == 404);
    }

    SECTION("Deleted file reads as not found") {
        fs::remove(dir / "claim-720p.mp4");
        CHECK(http_get(*port, "/content/claim-720p", "bytes=0-9").status == 404);
    }

    SECTION("Concurrent clients") {
        std::atomic<int> failures{0};
        std::vector<std::thread> clients;
        for (int t = 0; t < 6; ++t) {
            clients.emplace_back([&, t] {
                for (int i = 0; i < 5; ++i) {
                    const std::size_t start = static_cast<std::size_t>(t * 10'000 + i * 1'000);
                    const std::string range = "bytes=" + std::to_string(start) + "-" + std::to_string(start + 4'999);
                    auto reply = http_get(*port, "/content/claim-720p", range);
                    if (reply.status != 206 || reply.body != payload.substr(start, 5'000)) {
                        ++failures;
                    }
                }
            });
        }
        for (auto& c : clients) c.join();
        CHECK(failures == 0);
    }

    server.stop();
}

TEST_CASE("StreamingServer health and status", "[server]") {
    TempDir dir;
    write_file(dir / "a.mp4", std::string(1000, 'a'));
    write_file(dir / "b.webm", std::string(500, 'b'));

    StreamingServer server(nullptr, 2);
    REQUIRE(server.register_content("a", dir / "a.mp4", false).has_value());
    REQUIRE(server.register_content("b", dir / "b.webm", false).has_value());
    auto port = server.start();
    REQUIRE(port.has_value());

    auto health = http_get(*port, "/health");
    CHECK(health.status == 200);
    CHECK(health.header("content-type") == "application/json");
    auto health_json = nlohmann::json::parse(health.body);
    CHECK(health_json["status"] == "ok");
    CHECK(health_json["service"] == "vault-stream-server");

    auto status = http_get(*port, "/status");
    CHECK(status.status == 200);
    auto status_json = nlohmann::json::parse(status.body);
    CHECK(status_json["active_streams"] == 2);
    CHECK(status_json["encrypted_streams"] == 0);
    CHECK(status_json["unencrypted_streams"] == 2);
    CHECK(status_json["total_content_size_bytes"] == 1500);

    CHECK(http_get(*port, "/content/b").header("content-type") == "video/webm");

    server.stop();
}

TEST_CASE("StreamingServer registration", "[server]") {
    TempDir dir;
    StreamingServer server(nullptr, 1);

    SECTION("Empty key") {
        write_file(dir / "a.mp4", "x");
        auto result = server.register_content("", dir / "a.mp4", false);
        REQUIRE(!result.has_value());
        CHECK(result.error().is(VaultErrc::invalid_input));
    }

    SECTION("Missing file") {
        auto result = server.register_content("a", dir / "absent.mp4", false);
        REQUIRE(!result.has_value());
        CHECK(result.error().is(VaultErrc::content_not_found));
        CHECK(server.registry().size() == 0);
    }

    SECTION("Explicit content type and replacement") {
        write_file(dir / "a.bin", "12345");
        REQUIRE(server.register_content("a", dir / "a.bin", false, std::string("audio/mpeg")).has_value());
        auto entry = server.registry().find("a");
        REQUIRE(entry.has_value());
        CHECK(entry->content_type == "audio/mpeg");
        CHECK(entry->file_size == 5);

        write_file(dir / "b.mp4", "1234567890");
        REQUIRE(server.register_content("a", dir / "b.mp4", false).has_value());
        CHECK(server.registry().size() == 1);
        CHECK(server.registry().find("a")->file_size == 10);
    }
}

TEST_CASE("StreamingServer handle without a socket", "[server]") {
    TempDir dir;
    write_file(dir / "clip.mp4", "0123456789");
    write_file(dir / "empty.mp4", "");

    StreamingServer server(nullptr, 1);
    REQUIRE(server.register_content("clip", dir / "clip.mp4", false).has_value());
    REQUIRE(server.register_content("empty", dir / "empty.mp4", false).has_value());

    SECTION("Range") {
        auto res = server.handle(make_request(http::verb::get, "/content/clip", "bytes=2-5"));
        CHECK(res.result() == http::status::partial_content);
        CHECK(body_of(res) == "2345");
        CHECK(res[http::field::content_range] == "bytes 2-5/10");
    }

    SECTION("Query string is ignored") {
        auto res = server.handle(make_request(http::verb::get, "/content/clip?t=5"));
        CHECK(res.result() == http::status::ok);
        CHECK(body_of(res) == "0123456789");
    }

    SECTION("Empty file") {
        auto res = server.handle(make_request(http::verb::get, "/content/empty"));
        CHECK(res.result() == http::status::ok);
        CHECK(res.body().empty());
        CHECK(res[http::field::content_length] == "0");
    }

    SECTION("Keep-alive follows the request") {
        auto req = make_request(http::verb::get, "/content/clip");
        req.keep_alive(true);
        CHECK(server.handle(req).keep_alive());
        req.keep_alive(false);
        CHECK(!server.handle(req).keep_alive());
    }

    SECTION("File shrank after registration") {
        write_file(dir / "clip.mp4", "01234");
        auto res = server.handle(make_request(http::verb::get, "/content/clip", "bytes=3-9"));
        CHECK(res.result() == http::status::partial_content);
        CHECK(body_of(res) == "34");
        CHECK(res[http::field::content_range] == "bytes 3-4/10");

        auto past = server.handle(make_request(http::verb::get, "/content/clip", "bytes=7-9"));
        CHECK(past.result() == http::status::internal_server_error);
    }
}

TEST_CASE("StreamingServer decrypts encrypted content", "[server][encryption]") {
    TempDir dir;
    auto encryption = std::make_shared<EncryptionManager>(std::make_shared<FileSecretStore>(dir / "secrets"));
    REQUIRE(encryption->enable("passphrase").has_value());

    const auto payload = make_payload(3 * vault::core::CHUNK_SIZE + 77, 11);
    write_file(dir / "plain.mp4", payload);
    REQUIRE(encryption->encrypt_file(dir / "plain.mp4", dir / "0123abcd.bin").has_value());

    StreamingServer server(encryption, 2);
    REQUIRE(server.register_content("0123abcd", dir / "0123abcd.bin", true, std::string("video/mp4")).has_value());
    CHECK(server.registry().find("0123abcd")->file_size == payload.size());

    auto port = server.start();
    REQUIRE(port.has_value());

    SECTION("Whole file") {
        auto reply = http_get(*port, "/content/0123abcd");
        CHECK(reply.status == 200);
        CHECK(reply.body == payload);
        CHECK(reply.header("content-length") == std::to_string(payload.size()));
    }

    SECTION("Range crossing chunk boundaries") {
        const std::size_t start = vault::core::CHUNK_SIZE - 100;
        const std::size_t end = 2 * vault::core::CHUNK_SIZE + 100;
        auto reply = http_get(*port, "/content/0123abcd",
                              "bytes=" + std::to_string(start) + "-" + std::to_string(end));
        CHECK(reply.status == 206);
        CHECK(reply.body == payload.substr(start, end - start + 1));
        CHECK(reply.header("content-range") ==
              "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(payload.size()));
    }

    SECTION("Status counts encrypted streams") {
        auto json = nlohmann::json::parse(http_get(*port, "/status").body);
        CHECK(json["encrypted_streams"] == 1);
        CHECK(json["total_content_size_bytes"] == payload.size());
    }

    SECTION("Disabled key yields a server error") {
        REQUIRE(encryption->disable().has_value());
        auto reply = http_get(*port, "/content/0123abcd", "bytes=0-99");
        CHECK(reply.status == 500);
    }

    server.stop();
}
