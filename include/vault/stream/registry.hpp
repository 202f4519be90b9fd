// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace vault::stream {

struct StreamRegistration {
    std::string key;
    std::filesystem::path file_path;
    bool encrypted{false};
    std::string content_type;
    std::uint64_t file_size{0};  // Plaintext size served to clients
};

struct RegistrySummary {
    std::size_t active_streams{0};
    std::size_t encrypted_streams{0};
    std::size_t unencrypted_streams{0};
    std::uint64_t total_content_size_bytes{0};
};

// Content key -> registration. Lookups share the lock; inserts and removals
// take it exclusively. Lookups return copies so callers never hold the lock
// while serving.
class StreamRegistry {
public:
    // Replaces an existing entry with the same key
    void insert(StreamRegistration registration);

    // Returns false when the key was not registered
    bool remove(std::string_view key);

    [[nodiscard]] std::optional<StreamRegistration> find(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] RegistrySummary summary() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, StreamRegistration, std::less<>> entries_;
};

// MIME type from the file extension, application/octet-stream if unknown
[[nodiscard]] std::string guess_content_type(const std::filesystem::path& path);

} // namespace vault::stream
