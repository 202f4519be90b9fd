// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/crypto/encryption_manager.hpp>
#include <vault/disk/file.hpp>
#include <vault/log/logging.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <mutex>

namespace fs = std::filesystem;

namespace vault::crypto {

using core::CHUNK_SIZE;
using core::Error;
using core::KEY_SIZE;
using core::NONCE_SIZE;
using core::Result;
using core::TAG_SIZE;
using core::VaultErrc;

namespace {

constexpr const char* KEY_ENTRY = "encryption_key";
constexpr const char* SALT_ENTRY = "kdf_salt";
constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
constexpr std::size_t MAX_CHUNK_CIPHERTEXT = CHUNK_SIZE + TAG_SIZE;

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using Nonce = std::array<std::uint8_t, NONCE_SIZE>;

// Zeroes key material when it goes out of scope
struct KeyGuard {
    EncryptionManager::Key& key;
    ~KeyGuard() { OPENSSL_cleanse(key.data(), key.size()); }
};

Error crypto_error(std::string detail) {
    return Error(VaultErrc::encryption_failed, std::move(detail));
}

Error disk_error(const std::string& what, const fs::path& path, std::error_code ec) {
    return Error(VaultErrc::io_error, what + " " + path.string() + ": " + ec.message());
}

std::string base64_encode(const std::uint8_t* data, std::size_t size) {
    std::string out(4 * ((size + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(size));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    if (text.empty() || text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out(3 * text.size() / 4);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (text.ends_with("==")) padding = 2;
    else if (text.ends_with("=")) padding = 1;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

Nonce chunk_nonce(const Nonce& base, std::uint64_t index) noexcept {
    Nonce nonce = base;
    for (std::size_t i = 0; i < std::min<std::size_t>(8, NONCE_SIZE); ++i) {
        nonce[i] ^= static_cast<std::uint8_t>(index >> (8 * i));
    }
    return nonce;
}

void put_u32_le(std::uint8_t* out, std::uint32_t v) noexcept {
    out[0] = static_cast<std::uint8_t>(v);
    out[1] = static_cast<std::uint8_t>(v >> 8);
    out[2] = static_cast<std::uint8_t>(v >> 16);
    out[3] = static_cast<std::uint8_t>(v >> 24);
}

std::uint32_t get_u32_le(const std::uint8_t* in) noexcept {
    return static_cast<std::uint32_t>(in[0])
         | (static_cast<std::uint32_t>(in[1]) << 8)
         | (static_cast<std::uint32_t>(in[2]) << 16)
         | (static_cast<std::uint32_t>(in[3]) << 24);
}

// Seal one chunk, appending ciphertext || tag to `out`
Result<void> seal_chunk(const EncryptionManager::Key& key, const Nonce& nonce,
                        const std::uint8_t* plain, std::size_t size,
                        std::vector<std::uint8_t>& out) {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::unexpected(crypto_error("EVP_CIPHER_CTX_new failed"));
    }

    if (1 != EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
        1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
        1 != EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data())) {
        return std::unexpected(crypto_error("cipher initialization failed"));
    }

    out.resize(size + TAG_SIZE);
    int len = 0;
    if (1 != EVP_EncryptUpdate(ctx.get(), out.data(), &len, plain, static_cast<int>(size))) {
        return std::unexpected(crypto_error("encryption failed"));
    }
    int total = len;
    if (1 != EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len)) {
        return std::unexpected(crypto_error("encryption failed"));
    }
    total += len;

    if (1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                                 out.data() + total)) {
        return std::unexpected(crypto_error("cannot read authentication tag"));
    }
    out.resize(static_cast<std::size_t>(total) + TAG_SIZE);
    return {};
}

// Open one chunk. Any tag mismatch is reported as an authentication failure.
Result<void> open_chunk(const EncryptionManager::Key& key, const Nonce& nonce,
                        const std::uint8_t* sealed, std::size_t size,
                        std::vector<std::uint8_t>& out) {
    if (size < TAG_SIZE) {
        return std::unexpected(crypto_error("chunk shorter than authentication tag"));
    }
    const std::size_t cipher_size = size - TAG_SIZE;

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::unexpected(crypto_error("EVP_CIPHER_CTX_new failed"));
    }

    if (1 != EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
        1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
        1 != EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data())) {
        return std::unexpected(crypto_error("cipher initialization failed"));
    }

    out.resize(cipher_size + TAG_SIZE);
    int len = 0;
    if (1 != EVP_DecryptUpdate(ctx.get(), out.data(), &len, sealed, static_cast<int>(cipher_size))) {
        return std::unexpected(crypto_error("authentication failed"));
    }
    int total = len;

    std::array<std::uint8_t, TAG_SIZE> tag{};
    std::memcpy(tag.data(), sealed + cipher_size, TAG_SIZE);
    if (1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
        return std::unexpected(crypto_error("cannot set authentication tag"));
    }

    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) <= 0) {
        OPENSSL_cleanse(out.data(), out.size());
        out.clear();
        return std::unexpected(crypto_error("authentication failed"));
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));
    return {};
}

Result<Nonce> read_base_nonce(disk::File& file, const fs::path& path) {
    Nonce nonce{};
    auto n = file.read_at(0, nonce.data(), nonce.size());
    if (!n) {
        return std::unexpected(disk_error("cannot read", path, n.error()));
    }
    if (*n != NONCE_SIZE) {
        return std::unexpected(crypto_error("container too short: " + path.string()));
    }
    return nonce;
}

void remove_quietly(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

Result<std::string> random_token(std::size_t bytes) {
    static constexpr char HEX[] = "0123456789abcdef";

    std::vector<std::uint8_t> raw(bytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return std::unexpected(crypto_error("RAND_bytes failed"));
    }

    std::string token;
    token.reserve(bytes * 2);
    for (auto b : raw) {
        token += HEX[b >> 4];
        token += HEX[b & 0x0f];
    }
    return token;
}

//=============================================================================
// EncryptionManager
//=============================================================================

EncryptionManager::EncryptionManager(std::shared_ptr<SecretStore> store)
    : store_(std::move(store)) {}

EncryptionManager::~EncryptionManager() {
    if (key_) {
        OPENSSL_cleanse(key_->data(), key_->size());
    }
}

Result<void> EncryptionManager::enable(std::string_view passphrase) {
    if (passphrase.empty()) {
        return std::unexpected(Error(VaultErrc::invalid_input, "empty passphrase"));
    }

    // Per-installation salt, created on first use
    std::vector<std::uint8_t> salt;
    auto stored_salt = store_->get(SALT_ENTRY);
    if (!stored_salt) {
        log::security_event("key_generate", false, "secret store unavailable");
        return std::unexpected(crypto_error("secret store unavailable: " + stored_salt.error().message()));
    }
    if (*stored_salt) {
        auto decoded = base64_decode(**stored_salt);
        if (!decoded || decoded->size() != core::KDF_SALT_SIZE) {
            log::security_event("key_generate", false, "stored salt is malformed");
            return std::unexpected(crypto_error("stored KDF salt is malformed"));
        }
        salt = std::move(*decoded);
    } else {
        salt.resize(core::KDF_SALT_SIZE);
        if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
            return std::unexpected(crypto_error("RAND_bytes failed"));
        }
        if (auto saved = store_->set(SALT_ENTRY, base64_encode(salt.data(), salt.size())); !saved) {
            log::security_event("key_generate", false, "cannot persist salt");
            return std::unexpected(crypto_error("secret store unavailable: " + saved.error().message()));
        }
    }

    Key key{};
    KeyGuard guard{key};
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(core::KDF_ITERATIONS), EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        log::security_event("key_generate", false, "key derivation failed");
        return std::unexpected(crypto_error("key derivation failed"));
    }

    auto encoded = base64_encode(key.data(), key.size());
    auto saved = store_->set(KEY_ENTRY, encoded);
    OPENSSL_cleanse(encoded.data(), encoded.size());
    if (!saved) {
        log::security_event("key_generate", false, "cannot persist key");
        return std::unexpected(crypto_error("secret store unavailable: " + saved.error().message()));
    }

    {
        std::unique_lock lock(mutex_);
        key_ = key;
    }

    log::security_event("key_generate", true, "encryption key derived and stored");
    spdlog::info("EncryptionManager: encryption enabled");
    return {};
}

Result<bool> EncryptionManager::load() {
    auto stored = store_->get(KEY_ENTRY);
    if (!stored) {
        log::security_event("key_access", false, "secret store unavailable");
        return std::unexpected(Error(VaultErrc::secret_store_unavailable, stored.error().detail()));
    }
    if (!*stored) {
        return false;
    }

    auto decoded = base64_decode(**stored);
    OPENSSL_cleanse((*stored)->data(), (*stored)->size());
    if (!decoded || decoded->size() != KEY_SIZE) {
        log::security_event("key_access", false, "stored key is malformed");
        return std::unexpected(crypto_error("stored key is malformed"));
    }

    Key key{};
    KeyGuard guard{key};
    std::copy(decoded->begin(), decoded->end(), key.begin());
    OPENSSL_cleanse(decoded->data(), decoded->size());

    {
        std::unique_lock lock(mutex_);
        key_ = key;
    }

    log::security_event("key_access", true, "encryption key loaded");
    return true;
}

Result<void> EncryptionManager::disable() {
    {
        std::unique_lock lock(mutex_);
        if (key_) {
            OPENSSL_cleanse(key_->data(), key_->size());
            key_.reset();
        }
    }

    if (auto removed = store_->remove(KEY_ENTRY); !removed) {
        log::security_event("key_delete", false, "secret store unavailable");
        return std::unexpected(crypto_error("secret store unavailable: " + removed.error().message()));
    }

    log::security_event("key_delete", true, "encryption key removed");
    spdlog::info("EncryptionManager: encryption disabled");
    return {};
}

bool EncryptionManager::is_enabled() const {
    std::shared_lock lock(mutex_);
    return key_.has_value();
}

Result<EncryptionManager::Key> EncryptionManager::current_key() const {
    std::shared_lock lock(mutex_);
    if (!key_) {
        return std::unexpected(crypto_error("no encryption key loaded"));
    }
    return *key_;
}

Result<void> EncryptionManager::encrypt_file(const fs::path& input, const fs::path& output) const {
    auto key = current_key();
    if (!key) {
        return std::unexpected(key.error());
    }
    KeyGuard guard{*key};

    auto in = disk::File::open_read(input.string());
    if (!in) {
        return std::unexpected(disk_error("cannot open", input, in.error()));
    }
    auto out = disk::File::create(output.string());
    if (!out) {
        return std::unexpected(disk_error("cannot create", output, out.error()));
    }

    auto fail = [&](Error e) -> Result<void> {
        out->close();
        remove_quietly(output);
        return std::unexpected(std::move(e));
    };

    Nonce base{};
    if (RAND_bytes(base.data(), static_cast<int>(base.size())) != 1) {
        return fail(crypto_error("RAND_bytes failed"));
    }
    if (auto ec = out->write(base.data(), base.size())) {
        return fail(disk_error("cannot write", output, ec));
    }

    std::vector<std::uint8_t> plain(CHUNK_SIZE);
    std::vector<std::uint8_t> sealed;
    sealed.reserve(MAX_CHUNK_CIPHERTEXT);
    std::uint64_t index = 0;

    while (true) {
        auto n = in->read(plain.data(), plain.size());
        if (!n) {
            return fail(disk_error("cannot read", input, n.error()));
        }
        if (*n == 0) break;

        if (auto sealed_ok = seal_chunk(*key, chunk_nonce(base, index), plain.data(), *n, sealed); !sealed_ok) {
            return fail(sealed_ok.error());
        }

        std::uint8_t prefix[LENGTH_PREFIX_SIZE];
        put_u32_le(prefix, static_cast<std::uint32_t>(sealed.size()));
        if (auto ec = out->write(prefix, sizeof(prefix))) {
            return fail(disk_error("cannot write", output, ec));
        }
        if (auto ec = out->write(sealed.data(), sealed.size())) {
            return fail(disk_error("cannot write", output, ec));
        }

        ++index;
        if (*n < CHUNK_SIZE) break;
    }

    if (auto ec = out->flush()) {
        return fail(disk_error("cannot flush", output, ec));
    }

    OPENSSL_cleanse(plain.data(), plain.size());
    spdlog::debug("EncryptionManager: encrypted {} chunks into {}", index, output.filename().string());
    return {};
}

Result<void> EncryptionManager::decrypt_file(const fs::path& input, const fs::path& output) const {
    auto key = current_key();
    if (!key) {
        return std::unexpected(key.error());
    }
    KeyGuard guard{*key};

    auto index = build_chunk_index(input);
    if (!index) {
        return std::unexpected(index.error());
    }

    auto in = disk::File::open_read(input.string());
    if (!in) {
        return std::unexpected(disk_error("cannot open", input, in.error()));
    }
    auto base = read_base_nonce(*in, input);
    if (!base) {
        return std::unexpected(base.error());
    }

    auto out = disk::File::create(output.string());
    if (!out) {
        return std::unexpected(disk_error("cannot create", output, out.error()));
    }

    auto fail = [&](Error e) -> Result<void> {
        out->close();
        remove_quietly(output);
        return std::unexpected(std::move(e));
    };

    std::vector<std::uint8_t> sealed;
    std::vector<std::uint8_t> plain;
    for (std::size_t i = 0; i < index->size(); ++i) {
        const auto& entry = (*index)[i];
        sealed.resize(entry.encrypted_size);
        auto n = in->read_at(entry.file_offset + LENGTH_PREFIX_SIZE, sealed.data(), sealed.size());
        if (!n) {
            return fail(disk_error("cannot read", input, n.error()));
        }
        if (*n != sealed.size()) {
            return fail(crypto_error("container truncated"));
        }

        if (auto opened = open_chunk(*key, chunk_nonce(*base, i), sealed.data(), sealed.size(), plain); !opened) {
            spdlog::warn("EncryptionManager: chunk {} of {} failed authentication",
                         i, input.filename().string());
            return fail(opened.error());
        }
        if (auto ec = out->write(plain.data(), plain.size())) {
            return fail(disk_error("cannot write", output, ec));
        }
    }

    if (auto ec = out->flush()) {
        return fail(disk_error("cannot flush", output, ec));
    }
    return {};
}

Result<std::vector<std::uint8_t>>
EncryptionManager::decrypt_range(const fs::path& input, std::uint64_t start, std::uint64_t end) const {
    if (start > end) {
        return std::unexpected(Error(VaultErrc::invalid_range,
                                     std::to_string(start) + "-" + std::to_string(end)));
    }

    auto key = current_key();
    if (!key) {
        return std::unexpected(key.error());
    }
    KeyGuard guard{*key};

    auto index = build_chunk_index(input);
    if (!index) {
        return std::unexpected(index.error());
    }

    const std::uint64_t start_chunk = start / CHUNK_SIZE;
    if (index->empty() || start_chunk >= index->size()) {
        return std::vector<std::uint8_t>{};
    }
    const std::uint64_t end_chunk = std::min<std::uint64_t>(end / CHUNK_SIZE, index->size() - 1);

    auto in = disk::File::open_read(input.string());
    if (!in) {
        return std::unexpected(disk_error("cannot open", input, in.error()));
    }
    auto base = read_base_nonce(*in, input);
    if (!base) {
        return std::unexpected(base.error());
    }

    std::vector<std::uint8_t> result;
    result.reserve(static_cast<std::size_t>((end_chunk - start_chunk + 1) * CHUNK_SIZE));

    std::vector<std::uint8_t> sealed;
    std::vector<std::uint8_t> plain;
    for (std::uint64_t i = start_chunk; i <= end_chunk; ++i) {
        const auto& entry = (*index)[static_cast<std::size_t>(i)];
        sealed.resize(entry.encrypted_size);
        auto n = in->read_at(entry.file_offset + LENGTH_PREFIX_SIZE, sealed.data(), sealed.size());
        if (!n) {
            return std::unexpected(disk_error("cannot read", input, n.error()));
        }
        if (*n != sealed.size()) {
            return std::unexpected(crypto_error("container truncated"));
        }

        if (auto opened = open_chunk(*key, chunk_nonce(*base, i), sealed.data(), sealed.size(), plain); !opened) {
            spdlog::warn("EncryptionManager: chunk {} of {} failed authentication",
                         i, input.filename().string());
            OPENSSL_cleanse(result.data(), result.size());
            return std::unexpected(opened.error());
        }
        result.insert(result.end(), plain.begin(), plain.end());
    }

    // Trim to the requested inclusive range
    const std::uint64_t first = start_chunk * CHUNK_SIZE;
    const std::size_t head = static_cast<std::size_t>(start - first);
    if (head >= result.size()) {
        return std::vector<std::uint8_t>{};
    }
    const std::size_t tail = (end - first >= result.size())
        ? result.size()
        : static_cast<std::size_t>(end - first + 1);

    return std::vector<std::uint8_t>(result.begin() + static_cast<std::ptrdiff_t>(head),
                                     result.begin() + static_cast<std::ptrdiff_t>(tail));
}

Result<std::vector<ChunkIndexEntry>> EncryptionManager::build_chunk_index(const fs::path& input) {
    auto file = disk::File::open_read(input.string());
    if (!file) {
        if (file.error() == disk::DiskErrc::file_not_found) {
            return std::unexpected(Error(VaultErrc::content_not_found, input.string()));
        }
        return std::unexpected(disk_error("cannot open", input, file.error()));
    }

    auto size = file->size();
    if (!size) {
        return std::unexpected(disk_error("cannot stat", input, size.error()));
    }
    if (*size < NONCE_SIZE) {
        return std::unexpected(crypto_error("container too short: " + input.string()));
    }

    std::vector<ChunkIndexEntry> index;
    index.reserve(static_cast<std::size_t>(*size / (MAX_CHUNK_CIPHERTEXT + LENGTH_PREFIX_SIZE) + 1));

    std::uint64_t offset = NONCE_SIZE;
    while (offset < *size) {
        if (offset + LENGTH_PREFIX_SIZE > *size) {
            return std::unexpected(crypto_error("truncated length prefix at offset " + std::to_string(offset)));
        }

        std::uint8_t prefix[LENGTH_PREFIX_SIZE];
        auto n = file->read_at(offset, prefix, sizeof(prefix));
        if (!n) {
            return std::unexpected(disk_error("cannot read", input, n.error()));
        }
        if (*n != sizeof(prefix)) {
            return std::unexpected(crypto_error("truncated length prefix at offset " + std::to_string(offset)));
        }

        const std::uint64_t length = get_u32_le(prefix);
        if (length <= TAG_SIZE || length > MAX_CHUNK_CIPHERTEXT) {
            return std::unexpected(crypto_error("invalid chunk length " + std::to_string(length) +
                                                " at offset " + std::to_string(offset)));
        }
        if (offset + LENGTH_PREFIX_SIZE + length > *size) {
            return std::unexpected(crypto_error("chunk at offset " + std::to_string(offset) +
                                                " runs past end of file"));
        }

        index.push_back(ChunkIndexEntry{offset, length});
        offset += LENGTH_PREFIX_SIZE + length;
    }

    return index;
}

Result<std::uint64_t> EncryptionManager::plaintext_size(const fs::path& input) {
    auto index = build_chunk_index(input);
    if (!index) {
        return std::unexpected(index.error());
    }

    std::uint64_t total = 0;
    for (const auto& entry : *index) {
        total += entry.encrypted_size - TAG_SIZE;
    }
    return total;
}

} // namespace vault::crypto
