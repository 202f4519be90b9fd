// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/transfer_state.hpp>
#include <vault/disk/error.hpp>
#include <vault/disk/file.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace vault::core {

//=============================================================================
// TransferState
//=============================================================================

TransferState TransferState::for_key(const fs::path& vault_dir,
                                     std::string_view claim_id,
                                     std::string_view quality) {
    std::string key;
    key.reserve(claim_id.size() + quality.size() + 1);
    key += claim_id;
    key += '-';
    key += quality;

    TransferState state;
    state.lock_path = vault_dir / (key + ".lock");
    state.partial_path = vault_dir / (key + ".tmp");
    state.validator_path = vault_dir / (key + ".etag");
    return state;
}

std::uint64_t TransferState::partial_size() const noexcept {
    std::error_code ec;
    auto size = fs::file_size(partial_path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::optional<std::string> TransferState::load_validator() const noexcept {
    try {
        std::ifstream file(validator_path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string value;
        std::getline(file, value);
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
            value.pop_back();
        }
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception& e) {
        spdlog::warn("TransferState: cannot read validator {}: {}", validator_path.string(), e.what());
        return std::nullopt;
    }
}

std::error_code TransferState::save_validator(std::string_view validator) const noexcept {
    auto file = disk::File::create(validator_path.string());
    if (!file) {
        return file.error();
    }
    if (auto ec = file->write(validator.data(), validator.size())) {
        return ec;
    }
    return file->flush();
}

void TransferState::remove_validator() const noexcept {
    std::error_code ec;
    fs::remove(validator_path, ec);
}

void TransferState::remove_partial() const noexcept {
    std::error_code ec;
    fs::remove(partial_path, ec);
}

void TransferState::remove_all() const noexcept {
    std::error_code ec;
    fs::remove(partial_path, ec);
    fs::remove(validator_path, ec);
    fs::remove(lock_path, ec);
}

//=============================================================================
// LockMarker
//=============================================================================

Result<LockMarker> LockMarker::acquire(const fs::path& path) {
    auto file = disk::File::create_exclusive(path.string());
    if (!file) {
        if (file.error() == disk::DiskErrc::file_exists) {
            return std::unexpected(Error(VaultErrc::download_in_progress, path.filename().string()));
        }
        return std::unexpected(Error(VaultErrc::io_error,
                                     "cannot create lock marker " + path.string() + ": " +
                                     file.error().message()));
    }

    // Owner pid, for diagnostics only
    std::string owner = std::to_string(::getpid()) + "\n";
    if (auto ec = file->write(owner.data(), owner.size())) {
        spdlog::warn("LockMarker: cannot write owner to {}: {}", path.string(), ec.message());
    }

    return LockMarker(path);
}

LockMarker::~LockMarker() {
    release();
}

LockMarker::LockMarker(LockMarker&& other) noexcept
    : path_(std::move(other.path_))
    , held_(other.held_) {
    other.held_ = false;
}

LockMarker& LockMarker::operator=(LockMarker&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        held_ = other.held_;
        other.held_ = false;
    }
    return *this;
}

void LockMarker::release() noexcept {
    if (!held_) return;
    held_ = false;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("LockMarker: failed to remove {}: {}", path_.string(), ec.message());
    }
}

//=============================================================================
// Stale lock sweep
//=============================================================================

Result<std::size_t> sweep_stale_locks(const fs::path& vault_dir, std::chrono::seconds max_age) {
    std::error_code ec;
    if (!fs::exists(vault_dir, ec)) {
        return std::size_t{0};
    }

    fs::directory_iterator it(vault_dir, ec);
    if (ec) {
        return std::unexpected(Error(VaultErrc::io_error, "cannot list " + vault_dir.string()));
    }

    const auto now = fs::file_time_type::clock::now();
    std::size_t removed = 0;

    for (const auto& entry : it) {
        if (entry.path().extension() != ".lock") continue;

        auto mtime = entry.last_write_time(ec);
        if (ec) continue;

        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - mtime);
        if (age < max_age) continue;

        if (fs::remove(entry.path(), ec)) {
            ++removed;
            spdlog::info("TransferState: removed stale lock {} (age {}s)",
                         entry.path().filename().string(), age.count());
        } else if (ec) {
            spdlog::warn("TransferState: failed to remove stale lock {}: {}",
                         entry.path().string(), ec.message());
        }
    }

    return removed;
}

} // namespace vault::core
