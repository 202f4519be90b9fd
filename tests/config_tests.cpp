// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vault/core/config.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace vault::core;
namespace fs = std::filesystem;

TEST_CASE("Config constants", "[config]") {
    CHECK(CHUNK_SIZE == 64 * 1024);
    CHECK(NONCE_SIZE == 12);
    CHECK(TAG_SIZE == 16);
    CHECK(KEY_SIZE == 32);
    CHECK(DISK_SPACE_BUFFER == 200ull * 1024 * 1024);
    CHECK(STALE_LOCK_AGE == std::chrono::hours(1));
    CHECK(PROGRESS_INTERVAL == std::chrono::milliseconds(500));
}

TEST_CASE("VaultConfig defaults", "[config]") {
    auto config = VaultConfig::defaults();
    CHECK(config.vault_dir.filename() == "vault");
    CHECK(config.secret_service == "vault");
    CHECK(!config.encrypt_downloads);
    CHECK(config.disk_space_buffer_bytes == DISK_SPACE_BUFFER);
    CHECK(config.server_threads == SERVER_THREADS);
    CHECK(config.log_level == "info");
}

TEST_CASE("VaultConfig::parse", "[config]") {
    SECTION("Every key") {
        auto config = VaultConfig::parse(R"({
            "vault_dir": "/data/vault",
            "secret_service": "vault-test",
            "encrypt_downloads": true,
            "disk_space_buffer_bytes": 1024,
            "stale_lock_age_seconds": 60,
            "progress_interval_ms": 100,
            "connect_timeout_seconds": 5,
            "server_threads": 2,
            "log_level": "debug",
            "log_file": "/tmp/vault.log"
        })");
        REQUIRE(config.has_value());
        CHECK(config->vault_dir == fs::path("/data/vault"));
        CHECK(config->secret_service == "vault-test");
        CHECK(config->encrypt_downloads);
        CHECK(config->disk_space_buffer_bytes == 1024);
        CHECK(config->stale_lock_age == std::chrono::seconds(60));
        CHECK(config->progress_interval == std::chrono::milliseconds(100));
        CHECK(config->connect_timeout_seconds == 5);
        CHECK(config->server_threads == 2);
        CHECK(config->log_level == "debug");
        CHECK(config->log_file == "/tmp/vault.log");
    }

    SECTION("Missing keys keep defaults") {
        auto config = VaultConfig::parse(R"({"encrypt_downloads": true})");
        REQUIRE(config.has_value());
        CHECK(config->encrypt_downloads);
        CHECK(config->disk_space_buffer_bytes == DISK_SPACE_BUFFER);
        CHECK(config->vault_dir == VaultConfig::defaults().vault_dir);
    }

    SECTION("Zero server threads becomes one") {
        auto config = VaultConfig::parse(R"({"server_threads": 0})");
        REQUIRE(config.has_value());
        CHECK(config->server_threads == 1);
    }

    SECTION("Malformed JSON") {
        auto config = VaultConfig::parse("{ not json");
        REQUIRE(!config.has_value());
        CHECK(config.error().is(VaultErrc::invalid_input));
    }

    SECTION("Wrong type") {
        auto config = VaultConfig::parse(R"({"encrypt_downloads": "yes"})");
        REQUIRE(!config.has_value());
        CHECK(config.error().is(VaultErrc::invalid_input));
    }

    SECTION("Empty keyring service") {
        auto config = VaultConfig::parse(R"({"secret_service": ""})");
        REQUIRE(!config.has_value());
        CHECK(config.error().is(VaultErrc::invalid_input));
    }

    SECTION("Root must be an object") {
        auto config = VaultConfig::parse("[1, 2]");
        REQUIRE(!config.has_value());
        CHECK(config.error().is(VaultErrc::invalid_input));
    }
}

TEST_CASE("VaultConfig::load", "[config]") {
    auto dir = fs::temp_directory_path() / "vault_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    SECTION("Missing file yields defaults") {
        auto config = VaultConfig::load(dir / "absent.json");
        REQUIRE(config.has_value());
        CHECK(config->vault_dir == VaultConfig::defaults().vault_dir);
    }

    SECTION("File round trip through to_json") {
        auto original = VaultConfig::defaults();
        original.vault_dir = dir / "v";
        original.encrypt_downloads = true;
        original.server_threads = 3;

        const auto path = dir / "config.json";
        {
            std::ofstream out(path);
            out << original.to_json();
        }

        auto loaded = VaultConfig::load(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->vault_dir == original.vault_dir);
        CHECK(loaded->encrypt_downloads);
        CHECK(loaded->server_threads == 3);
    }

    fs::remove_all(dir);
}

TEST_CASE("expand_home", "[config]") {
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        CHECK(expand_home("~/media") == fs::path(home) / "media");
    }
    CHECK(expand_home("/abs/path") == fs::path("/abs/path"));
    CHECK(expand_home("relative") == fs::path("relative"));
}
