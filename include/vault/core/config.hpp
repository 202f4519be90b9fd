// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace vault::core {

constexpr std::size_t CHUNK_SIZE = 64 * 1024;                       // Plaintext bytes per encrypted chunk
constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;
constexpr std::size_t KEY_SIZE = 32;
constexpr std::size_t KDF_SALT_SIZE = 16;
constexpr std::uint32_t KDF_ITERATIONS = 100'000;

constexpr std::uint64_t DISK_SPACE_BUFFER = 200ull * 1024 * 1024;  // 200 MB safety margin
constexpr std::chrono::seconds STALE_LOCK_AGE{3600};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{500};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;
constexpr std::uint32_t SERVER_THREADS = 4;

// Runtime settings, loaded from JSON. Every key is optional.
struct VaultConfig {
    std::filesystem::path vault_dir;
    std::string secret_service{"vault"};   // keyring service attribute
    bool encrypt_downloads{false};
    std::uint64_t disk_space_buffer_bytes{DISK_SPACE_BUFFER};
    std::chrono::seconds stale_lock_age{STALE_LOCK_AGE};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::uint32_t connect_timeout_seconds{CONNECTION_TIMEOUT_SEC};
    std::uint32_t server_threads{SERVER_THREADS};
    std::string log_level{"info"};
    std::string log_file;

    // Defaults rooted at $XDG_DATA_HOME/vault (or ~/.local/share/vault)
    [[nodiscard]] static VaultConfig defaults();

    // Missing file yields defaults; malformed JSON is invalid_input
    [[nodiscard]] static Result<VaultConfig> load(const std::filesystem::path& path);

    [[nodiscard]] static Result<VaultConfig> parse(const std::string& json_text);

    [[nodiscard]] std::string to_json() const;
};

// Expand a leading "~/" against $HOME
[[nodiscard]] std::filesystem::path expand_home(const std::string& path);

} // namespace vault::core
