// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/config.hpp>
#include <vault/core/error.hpp>
#include <vault/crypto/secret_store.hpp>
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vault::crypto {

// Location of one chunk inside a container
struct ChunkIndexEntry {
    std::uint64_t file_offset{0};     // Offset of the 4-byte length prefix
    std::uint64_t encrypted_size{0};  // Ciphertext plus tag
};

// AES-256-GCM chunked container:
//   [12-byte base nonce] then per chunk [u32 LE length][ciphertext || 16-byte tag]
// Chunk i holds up to CHUNK_SIZE plaintext bytes and is sealed with the base
// nonce whose first 8 bytes are XORed with little-endian i.
//
// Decryption only reads the key, so concurrent decrypt calls are safe.
// enable/load/disable take the key lock exclusively.
class EncryptionManager {
public:
    using Key = std::array<std::uint8_t, core::KEY_SIZE>;

    explicit EncryptionManager(std::shared_ptr<SecretStore> store);
    ~EncryptionManager();

    EncryptionManager(const EncryptionManager&) = delete;
    EncryptionManager& operator=(const EncryptionManager&) = delete;

    // Derive a key with PBKDF2-HMAC-SHA256 and persist it in the secret store
    [[nodiscard]] core::Result<void> enable(std::string_view passphrase);

    // Load a persisted key. false when none is stored.
    [[nodiscard]] core::Result<bool> load();

    // Wipe the in-memory key and delete the stored one
    [[nodiscard]] core::Result<void> disable();

    [[nodiscard]] bool is_enabled() const;

    [[nodiscard]] core::Result<void> encrypt_file(const std::filesystem::path& input,
                                                  const std::filesystem::path& output) const;

    [[nodiscard]] core::Result<void> decrypt_file(const std::filesystem::path& input,
                                                  const std::filesystem::path& output) const;

    // Plaintext bytes [start, end] inclusive. Empty when start is past the
    // last chunk. Only the overlapping chunks are decrypted.
    [[nodiscard]] core::Result<std::vector<std::uint8_t>>
    decrypt_range(const std::filesystem::path& input, std::uint64_t start, std::uint64_t end) const;

    // Scan length prefixes from after the base nonce to end of file
    [[nodiscard]] static core::Result<std::vector<ChunkIndexEntry>>
    build_chunk_index(const std::filesystem::path& input);

    // Sum of chunk plaintext sizes, without decrypting
    [[nodiscard]] static core::Result<std::uint64_t>
    plaintext_size(const std::filesystem::path& input);

private:
    [[nodiscard]] core::Result<Key> current_key() const;

    std::shared_ptr<SecretStore> store_;
    mutable std::shared_mutex mutex_;
    std::optional<Key> key_;
};

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG
[[nodiscard]] core::Result<std::string> random_token(std::size_t bytes);

} // namespace vault::crypto
