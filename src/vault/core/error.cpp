// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/error.hpp>

namespace vault::core {

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

} // namespace

//=============================================================================
// Error
//=============================================================================

Error::Error(std::error_code code, std::string detail)
    : code_(code)
    , detail_(std::move(detail)) {}

Error::Error(VaultErrc code, std::string detail)
    : code_(make_error_code(code))
    , detail_(std::move(detail)) {}

Error Error::insufficient_disk_space(std::uint64_t required, std::uint64_t available) {
    Error e(VaultErrc::insufficient_disk_space,
            "required " + std::to_string(required) + " bytes, available " +
            std::to_string(available) + " bytes");
    e.required = required;
    e.available = available;
    return e;
}

Error Error::download_interrupted(std::uint64_t bytes_downloaded,
                                  std::uint64_t total_bytes,
                                  std::string detail) {
    std::string text = std::to_string(bytes_downloaded) + " of " +
                       std::to_string(total_bytes) + " bytes";
    if (!detail.empty()) {
        text += ": ";
        text += detail;
    }
    Error e(VaultErrc::download_interrupted, std::move(text));
    e.bytes_downloaded = bytes_downloaded;
    e.total_bytes = total_bytes;
    return e;
}

Error Error::http_status(std::int32_t status) {
    Error e(VaultErrc::http_error, "server returned status " + std::to_string(status));
    e.http_status_code = status;
    return e;
}

std::string Error::message() const {
    std::string text = code_.message();
    if (!detail_.empty()) {
        text += ": ";
        text += detail_;
    }
    return text;
}

std::string_view Error::category() const noexcept {
    if (code_.category() != vault_errc_category()) {
        return "io";
    }
    switch (static_cast<VaultErrc>(code_.value())) {
        case VaultErrc::insufficient_disk_space:  return "disk_space";
        case VaultErrc::download_in_progress:     return "in_progress";
        case VaultErrc::download_interrupted:     return "interrupted";
        case VaultErrc::file_corruption:          return "corruption";
        case VaultErrc::encryption_failed:
        case VaultErrc::secret_store_unavailable: return "encryption";
        case VaultErrc::content_not_found:        return "not_found";
        case VaultErrc::invalid_range:            return "range";
        case VaultErrc::network_error:            return "network";
        case VaultErrc::http_error:               return "http";
        case VaultErrc::io_error:                 return "io";
        case VaultErrc::invalid_input:            return "input";
        case VaultErrc::server_error:             return "server";
        default:                                  return "unknown";
    }
}

bool Error::recoverable() const noexcept {
    if (is(VaultErrc::download_interrupted) || is(VaultErrc::network_error)) {
        return true;
    }
    if (is(VaultErrc::http_error)) {
        return http_status_code >= 500;
    }
    return false;
}

std::string Error::user_message() const {
    if (code_.category() != vault_errc_category()) {
        return "A file operation failed. Please check the vault directory.";
    }
    switch (static_cast<VaultErrc>(code_.value())) {
        case VaultErrc::insufficient_disk_space:
            return "Not enough disk space. Need " + std::to_string(required / MiB) +
                   " MB, but only " + std::to_string(available / MiB) + " MB available.";
        case VaultErrc::download_in_progress:
            return "This content is already being downloaded.";
        case VaultErrc::download_interrupted:
            return "Download was interrupted. You can resume it later.";
        case VaultErrc::file_corruption:
            return "The downloaded file is incomplete. Please download it again.";
        case VaultErrc::encryption_failed:
            return "Failed to encrypt or decrypt content. Your encryption key may be invalid.";
        case VaultErrc::secret_store_unavailable:
            return "The encryption key store is not available.";
        case VaultErrc::content_not_found:
            return "The requested content could not be found.";
        case VaultErrc::invalid_range:
            return "The requested byte range is not valid for this content.";
        case VaultErrc::network_error:
            return "Network connection failed. Please check your internet connection.";
        case VaultErrc::http_error:
            if (http_status_code >= 500) {
                return "The server is temporarily unavailable. Please try again later.";
            }
            return "The server refused the request.";
        case VaultErrc::invalid_input:
            return "The request was not valid.";
        default:
            return "An unexpected error occurred. Please try again.";
    }
}

} // namespace vault::core
