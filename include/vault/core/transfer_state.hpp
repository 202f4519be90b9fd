// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace vault::core {

// On-disk artifacts of one transfer, keyed by "claim_id-quality"
struct TransferState {
    std::filesystem::path lock_path;       // <key>.lock
    std::filesystem::path partial_path;    // <key>.tmp
    std::filesystem::path validator_path;  // <key>.etag

    [[nodiscard]] static TransferState for_key(const std::filesystem::path& vault_dir,
                                               std::string_view claim_id,
                                               std::string_view quality);

    // Length of the partial file, 0 if absent
    [[nodiscard]] std::uint64_t partial_size() const noexcept;

    [[nodiscard]] std::optional<std::string> load_validator() const noexcept;
    [[nodiscard]] std::error_code save_validator(std::string_view validator) const noexcept;

    void remove_validator() const noexcept;
    void remove_partial() const noexcept;

    // Partial, validator and lock marker
    void remove_all() const noexcept;
};

// Exclusive-create sentinel file. Removed when the owner goes out of scope.
class LockMarker {
public:
    // Fails with download_in_progress if the marker already exists
    [[nodiscard]] static Result<LockMarker> acquire(const std::filesystem::path& path);

    ~LockMarker();

    LockMarker(const LockMarker&) = delete;
    LockMarker& operator=(const LockMarker&) = delete;
    LockMarker(LockMarker&&) noexcept;
    LockMarker& operator=(LockMarker&&) noexcept;

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return held_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit LockMarker(std::filesystem::path path) : path_(std::move(path)), held_(true) {}

    std::filesystem::path path_;
    bool held_{false};
};

// Remove *.lock files in vault_dir older than max_age. Returns the count.
[[nodiscard]] Result<std::size_t> sweep_stale_locks(const std::filesystem::path& vault_dir,
                                                    std::chrono::seconds max_age);

} // namespace vault::core
