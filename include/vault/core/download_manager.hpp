// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/config.hpp>
#include <vault/core/error.hpp>
#include <vault/core/events.hpp>
#include <vault/core/http_session.hpp>
#include <vault/core/models.hpp>
#include <vault/core/transfer_state.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <string_view>

namespace vault::crypto {
class EncryptionManager;
}

namespace vault::core {

// Resumable single-file transfers into the vault directory.
//
// One transfer per (claim_id, quality) at a time, enforced by an on-disk lock
// marker. Every failure removes the files it created, except
// download_interrupted, which keeps the partial and validator files so the
// next download() call resumes.
class DownloadManager {
public:
    DownloadManager(VaultConfig config,
                    std::shared_ptr<crypto::EncryptionManager> encryption,
                    std::shared_ptr<EventSink> events = nullptr);

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Create the vault directory and reclaim stale locks
    [[nodiscard]] Result<void> initialize();

    [[nodiscard]] Result<OfflineMetadata> download(const DownloadRequest& request, bool encrypt);

    // Runs download() on a new thread
    [[nodiscard]] std::future<Result<OfflineMetadata>> download_async(DownloadRequest request, bool encrypt);

    // Remove partial, lock and validator files. Idempotent.
    [[nodiscard]] Result<void> cleanup_failed(std::string_view claim_id, std::string_view quality);

    // Remove the final file plus any stray transfer files. Idempotent.
    [[nodiscard]] Result<void> delete_content(std::string_view claim_id,
                                              std::string_view quality,
                                              std::string_view filename);

    // Resolve a vault filename; content_not_found if missing
    [[nodiscard]] Result<std::filesystem::path> content_path(std::string_view filename) const;

    [[nodiscard]] Result<std::size_t> sweep_stale_locks();
    [[nodiscard]] Result<std::size_t> sweep_stale_locks(std::chrono::seconds max_age);

    [[nodiscard]] DownloadStats stats() const noexcept;

    [[nodiscard]] const VaultConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::filesystem::path& vault_dir() const noexcept { return config_.vault_dir; }

private:
    [[nodiscard]] Result<OfflineMetadata> transfer(const DownloadRequest& request,
                                                   bool encrypt,
                                                   const TransferState& state,
                                                   LockMarker& lock);

    [[nodiscard]] Result<void> check_disk_space(std::uint64_t total, std::uint64_t resume_from) const;

    [[nodiscard]] Result<std::string> finalize(const DownloadRequest& request,
                                               bool encrypt,
                                               const TransferState& state);

    void record(std::uint64_t bytes, std::chrono::milliseconds duration) noexcept;

    VaultConfig config_;
    HttpSession http_;
    std::shared_ptr<crypto::EncryptionManager> encryption_;
    std::shared_ptr<EventSink> events_;

    std::atomic<std::uint64_t> total_downloads_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> total_duration_ms_{0};
};

// Non-empty, no path separators, no "..", no NUL
[[nodiscard]] bool is_safe_name(std::string_view name) noexcept;

} // namespace vault::core
