// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/download_manager.hpp>
#include <vault/core/url.hpp>
#include <vault/crypto/encryption_manager.hpp>
#include <vault/disk/file.hpp>
#include <vault/disk/space.hpp>
#include <vault/log/logging.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>

namespace fs = std::filesystem;
namespace chrono = std::chrono;

namespace vault::core {

namespace {

constexpr std::size_t RANDOM_NAME_BYTES = 16;

std::int64_t elapsed_ms(chrono::steady_clock::time_point since) {
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - since).count();
}

} // namespace

bool is_safe_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string_view::npos) return false;
    if (name.find('\\') != std::string_view::npos) return false;
    if (name.find('\0') != std::string_view::npos) return false;
    if (name.find("..") != std::string_view::npos) return false;
    return true;
}

//=============================================================================
// DownloadManager
//=============================================================================

DownloadManager::DownloadManager(VaultConfig config,
                                 std::shared_ptr<crypto::EncryptionManager> encryption,
                                 std::shared_ptr<EventSink> events)
    : config_(std::move(config))
    , http_(HttpOptions{config_.connect_timeout_seconds, STALL_TIMEOUT_SEC, MAX_REDIRECTS})
    , encryption_(std::move(encryption))
    , events_(std::move(events)) {}

Result<void> DownloadManager::initialize() {
    std::error_code ec;
    fs::create_directories(config_.vault_dir, ec);
    if (ec) {
        return std::unexpected(Error(VaultErrc::io_error,
                                     "cannot create vault directory " + config_.vault_dir.string() +
                                     ": " + ec.message()));
    }

    auto swept = sweep_stale_locks();
    if (!swept) {
        return std::unexpected(swept.error());
    }
    spdlog::info("DownloadManager: vault at {} ({} stale locks removed)",
                 config_.vault_dir.string(), *swept);
    return {};
}

Result<OfflineMetadata> DownloadManager::download(const DownloadRequest& request, bool encrypt) {
    auto result = [&]() -> Result<OfflineMetadata> {
        if (!is_safe_name(request.claim_id) || !is_safe_name(request.quality)) {
            return std::unexpected(Error(VaultErrc::invalid_input, "invalid claim_id or quality"));
        }

        auto url = Url::parse(request.source_url);
        if (!url || !url->is_http()) {
            return std::unexpected(Error(VaultErrc::invalid_input, "source_url must be http or https"));
        }

        if (encrypt && (!encryption_ || !encryption_->is_enabled())) {
            return std::unexpected(Error(VaultErrc::encryption_failed, "encryption is not enabled"));
        }

        std::error_code ec;
        fs::create_directories(config_.vault_dir, ec);
        if (ec) {
            return std::unexpected(Error(VaultErrc::io_error,
                                         "cannot create vault directory: " + ec.message()));
        }

        auto state = TransferState::for_key(config_.vault_dir, request.claim_id, request.quality);
        auto lock = LockMarker::acquire(state.lock_path);
        if (!lock) {
            return std::unexpected(lock.error());
        }

        return transfer(request, encrypt, state, *lock);
    }();

    if (result) {
        spdlog::info("DownloadManager: {} complete ({} bytes, encrypted: {})",
                     request.key(), result->file_size, result->encrypted);
        if (events_) events_->on_download_completed(*result);
    } else {
        if (result.error().recoverable()) {
            spdlog::warn("DownloadManager: {} failed: {}", request.key(), result.error().message());
        } else {
            spdlog::error("DownloadManager: {} failed: {}", request.key(), result.error().message());
        }
        if (events_) events_->on_download_failed(request, result.error());
    }
    return result;
}

std::future<Result<OfflineMetadata>> DownloadManager::download_async(DownloadRequest request, bool encrypt) {
    return std::async(std::launch::async, [this, request = std::move(request), encrypt]() {
        return download(request, encrypt);
    });
}

Result<OfflineMetadata> DownloadManager::transfer(const DownloadRequest& request,
                                                  bool encrypt,
                                                  const TransferState& state,
                                                  LockMarker& lock) {
    const auto started = chrono::steady_clock::now();

    std::uint64_t resume_from = state.partial_size();
    const auto stored_validator = state.load_validator();

    spdlog::info("DownloadManager: starting {} from {} (resume from {})",
                 request.key(), log::redact_url(request.source_url), resume_from);

    // Metadata probe
    std::optional<std::uint64_t> total;
    std::string remote_validator;
    bool accepts_ranges = false;

    auto probe = http_.head(request.source_url);
    if (probe) {
        total = probe->resource_size();
        remote_validator = probe->etag;
        accepts_ranges = probe->accepts_ranges;
    } else if (probe.error().is(VaultErrc::http_error) &&
               (probe.error().http_status_code == 405 || probe.error().http_status_code == 501)) {
        spdlog::warn("DownloadManager: HEAD not supported by {}, continuing without metadata",
                     log::redact_url(request.source_url));
    } else {
        return std::unexpected(probe.error());
    }

    if (resume_from > 0 && stored_validator && !remote_validator.empty() &&
        *stored_validator != remote_validator) {
        spdlog::warn("DownloadManager: remote content of {} changed, restarting from zero", request.key());
        state.remove_partial();
        state.remove_validator();
        resume_from = 0;
    }

    if (resume_from > 0 && total && resume_from >= *total) {
        spdlog::warn("DownloadManager: partial file of {} is not shorter than the resource, restarting",
                     request.key());
        state.remove_partial();
        resume_from = 0;
    }

    if (resume_from > 0 && !accepts_ranges) {
        spdlog::warn("DownloadManager: server does not support ranges, restarting {} from zero", request.key());
        state.remove_partial();
        resume_from = 0;
    }

    bool space_checked = false;
    if (total) {
        if (auto space = check_disk_space(*total, resume_from); !space) {
            return std::unexpected(space.error());
        }
        space_checked = true;
    }

    std::optional<disk::File> file;
    std::optional<Error> abort_reason;
    std::uint64_t session_bytes = 0;
    auto session_start = chrono::steady_clock::now();
    auto last_emit = session_start;

    auto emit_progress = [&](bool force) {
        const auto now = chrono::steady_clock::now();
        if (!force && now - last_emit < config_.progress_interval) return;
        last_emit = now;
        if (!events_) return;

        DownloadProgress progress;
        progress.claim_id = request.claim_id;
        progress.quality = request.quality;
        progress.bytes_written = resume_from + session_bytes;
        progress.total_bytes = total.value_or(0);
        if (total && *total > 0) {
            progress.percent = std::min(100.0, static_cast<double>(progress.bytes_written) * 100.0 /
                                               static_cast<double>(*total));
        }
        const double elapsed = chrono::duration<double>(now - session_start).count();
        if (elapsed > 0.0) {
            progress.speed_bytes_per_sec = static_cast<std::uint64_t>(static_cast<double>(session_bytes) / elapsed);
        }
        events_->on_download_progress(progress);
    };

    auto on_response = [&](const HttpResponse& response) -> std::error_code {
        if (resume_from > 0 && response.status_code != 206) {
            spdlog::warn("DownloadManager: server ignored range request for {}, restarting from zero",
                         request.key());
            resume_from = 0;
            // The whole resource has to fit now
            if (total) {
                if (auto space = check_disk_space(*total, 0); !space) {
                    abort_reason = space.error();
                    return make_error_code(VaultErrc::insufficient_disk_space);
                }
            }
        }
        if (resume_from > 0 && response.range_start && *response.range_start != resume_from) {
            abort_reason = Error(VaultErrc::file_corruption,
                                 "server resumed at offset " + std::to_string(*response.range_start) +
                                 " instead of " + std::to_string(resume_from));
            return make_error_code(VaultErrc::file_corruption);
        }

        if (!total) {
            total = response.resource_size();
            if (total && !space_checked) {
                if (auto space = check_disk_space(*total, resume_from); !space) {
                    abort_reason = space.error();
                    return make_error_code(VaultErrc::insufficient_disk_space);
                }
                space_checked = true;
            }
        }

        // Persist the validator now so a failed attempt can still resume
        const std::string& validator = !remote_validator.empty() ? remote_validator : response.etag;
        if (!validator.empty()) {
            if (auto ec = state.save_validator(validator)) {
                spdlog::warn("DownloadManager: cannot save validator for {}: {}", request.key(), ec.message());
            }
        }

        auto opened = resume_from > 0
            ? disk::File::open_append(state.partial_path.string())
            : disk::File::create(state.partial_path.string());
        if (!opened) {
            abort_reason = Error(VaultErrc::io_error,
                                 "cannot open " + state.partial_path.string() + ": " + opened.error().message());
            return opened.error();
        }
        file.emplace(std::move(*opened));

        session_start = last_emit = chrono::steady_clock::now();
        if (events_) events_->on_download_started(request, resume_from, total);
        return {};
    };

    auto on_data = [&](const char* data, std::size_t size) -> std::error_code {
        if (auto ec = file->write(data, size)) {
            return ec;
        }
        session_bytes += size;
        emit_progress(false);
        return {};
    };

    auto response = http_.get(request.source_url, resume_from, on_response, on_data);

    if (!response) {
        if (file) {
            if (auto ec = file->flush()) {
                spdlog::warn("DownloadManager: cannot flush partial file of {}: {}", request.key(), ec.message());
            }
            file->close();
        }

        if (abort_reason) {
            if (abort_reason->is(VaultErrc::file_corruption)) {
                state.remove_partial();
                state.remove_validator();
            }
            return std::unexpected(*abort_reason);
        }
        if (file) {
            // Partial and validator stay for the next attempt
            return std::unexpected(Error::download_interrupted(
                state.partial_size(), total.value_or(0), response.error().message()));
        }
        return std::unexpected(response.error());
    }

    if (!file) {
        return std::unexpected(Error(VaultErrc::network_error, "no response received"));
    }
    if (auto ec = file->flush()) {
        file->close();
        return std::unexpected(Error::download_interrupted(
            state.partial_size(), total.value_or(0), ec.message()));
    }
    file->close();

    const std::uint64_t actual = state.partial_size();
    if (total && actual != *total) {
        state.remove_partial();
        state.remove_validator();
        return std::unexpected(Error(VaultErrc::file_corruption,
                                     "expected " + std::to_string(*total) + " bytes, got " +
                                     std::to_string(actual)));
    }
    emit_progress(true);

    state.remove_validator();

    auto filename = finalize(request, encrypt, state);
    if (!filename) {
        return std::unexpected(filename.error());
    }

    lock.release();

    const auto final_path = config_.vault_dir / *filename;
    std::error_code ec;
    const auto file_size = fs::file_size(final_path, ec);
    if (ec) {
        return std::unexpected(Error(VaultErrc::io_error, "cannot stat " + final_path.string()));
    }

    record(session_bytes, chrono::milliseconds(elapsed_ms(started)));

    OfflineMetadata metadata;
    metadata.claim_id = request.claim_id;
    metadata.quality = request.quality;
    metadata.filename = *filename;
    metadata.file_size = static_cast<std::uint64_t>(file_size);
    metadata.encrypted = encrypt;
    metadata.added_at = chrono::system_clock::now();
    return metadata;
}

Result<void> DownloadManager::check_disk_space(std::uint64_t total, std::uint64_t resume_from) const {
    const std::uint64_t remaining = total > resume_from ? total - resume_from : 0;
    const std::uint64_t required = remaining + config_.disk_space_buffer_bytes;

    auto space = disk::query_space(config_.vault_dir);
    if (!space) {
        spdlog::warn("DownloadManager: cannot determine free space for {}: {}",
                     config_.vault_dir.string(), space.error().message());
        return {};
    }
    if (space->available < required) {
        return std::unexpected(Error::insufficient_disk_space(required, space->available));
    }
    return {};
}

Result<std::string> DownloadManager::finalize(const DownloadRequest& request,
                                              bool encrypt,
                                              const TransferState& state) {
    if (!encrypt) {
        std::string filename = request.key() + ".mp4";
        std::error_code ec;
        fs::rename(state.partial_path, config_.vault_dir / filename, ec);
        if (ec) {
            // Without a validator the partial cannot be resumed
            state.remove_partial();
            return std::unexpected(Error(VaultErrc::io_error, "cannot rename partial file: " + ec.message()));
        }
        return filename;
    }

    // Opaque name so ciphertext files do not reveal claim ids
    auto token = crypto::random_token(RANDOM_NAME_BYTES);
    if (!token) {
        state.remove_partial();
        return std::unexpected(token.error());
    }
    std::string filename = *token + ".bin";
    const auto final_path = config_.vault_dir / filename;

    auto encrypted = encryption_->encrypt_file(state.partial_path, final_path);
    state.remove_partial();
    if (!encrypted) {
        std::error_code ec;
        fs::remove(final_path, ec);
        if (encrypted.error().is(VaultErrc::encryption_failed)) {
            return std::unexpected(encrypted.error());
        }
        return std::unexpected(Error(VaultErrc::encryption_failed, encrypted.error().message()));
    }
    return filename;
}

void DownloadManager::record(std::uint64_t bytes, chrono::milliseconds duration) noexcept {
    total_downloads_.fetch_add(1, std::memory_order_relaxed);
    total_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    total_duration_ms_.fetch_add(static_cast<std::uint64_t>(duration.count()), std::memory_order_relaxed);
}

DownloadStats DownloadManager::stats() const noexcept {
    DownloadStats s;
    s.total_downloads = total_downloads_.load(std::memory_order_relaxed);
    s.total_bytes_downloaded = total_bytes_.load(std::memory_order_relaxed);
    s.total_duration_ms = total_duration_ms_.load(std::memory_order_relaxed);
    if (s.total_duration_ms > 0) {
        s.average_throughput_bytes_per_sec = s.total_bytes_downloaded * 1000 / s.total_duration_ms;
    }
    return s;
}

Result<void> DownloadManager::cleanup_failed(std::string_view claim_id, std::string_view quality) {
    if (!is_safe_name(claim_id) || !is_safe_name(quality)) {
        return std::unexpected(Error(VaultErrc::invalid_input, "invalid claim_id or quality"));
    }
    TransferState::for_key(config_.vault_dir, claim_id, quality).remove_all();
    spdlog::info("DownloadManager: cleaned up transfer files for {}-{}", claim_id, quality);
    return {};
}

Result<void> DownloadManager::delete_content(std::string_view claim_id,
                                             std::string_view quality,
                                             std::string_view filename) {
    if (!is_safe_name(claim_id) || !is_safe_name(quality)) {
        return std::unexpected(Error(VaultErrc::invalid_input, "invalid claim_id or quality"));
    }
    if (!filename.empty() && !is_safe_name(filename)) {
        return std::unexpected(Error(VaultErrc::invalid_input, "invalid filename"));
    }

    if (!filename.empty()) {
        std::error_code ec;
        fs::remove(config_.vault_dir / std::string(filename), ec);
        if (ec) {
            return std::unexpected(Error(VaultErrc::io_error,
                                         "cannot delete " + std::string(filename) + ": " + ec.message()));
        }
    }
    TransferState::for_key(config_.vault_dir, claim_id, quality).remove_all();

    spdlog::info("DownloadManager: deleted content {}-{}", claim_id, quality);
    return {};
}

Result<fs::path> DownloadManager::content_path(std::string_view filename) const {
    if (!is_safe_name(filename)) {
        return std::unexpected(Error(VaultErrc::invalid_input, "invalid filename"));
    }
    auto path = config_.vault_dir / std::string(filename);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(Error(VaultErrc::content_not_found, std::string(filename)));
    }
    return path;
}

Result<std::size_t> DownloadManager::sweep_stale_locks() {
    return sweep_stale_locks(config_.stale_lock_age);
}

Result<std::size_t> DownloadManager::sweep_stale_locks(chrono::seconds max_age) {
    return core::sweep_stale_locks(config_.vault_dir, max_age);
}

} // namespace vault::core
