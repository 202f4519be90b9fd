// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace vault::core {

enum class VaultErrc {
    success = 0,
    insufficient_disk_space,
    download_in_progress,
    download_interrupted,
    file_corruption,
    encryption_failed,
    content_not_found,
    invalid_range,
    network_error,
    http_error,
    io_error,
    invalid_input,
    secret_store_unavailable,
    server_error,
};

namespace detail {

struct VaultErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "vault";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<VaultErrc>(ev)) {
            case VaultErrc::success:                  return "Success";
            case VaultErrc::insufficient_disk_space:  return "Insufficient disk space";
            case VaultErrc::download_in_progress:     return "Download already in progress";
            case VaultErrc::download_interrupted:     return "Download interrupted";
            case VaultErrc::file_corruption:          return "File corruption detected";
            case VaultErrc::encryption_failed:        return "Encryption error";
            case VaultErrc::content_not_found:        return "Content not found";
            case VaultErrc::invalid_range:            return "Range not satisfiable";
            case VaultErrc::network_error:            return "Network error";
            case VaultErrc::http_error:               return "HTTP error";
            case VaultErrc::io_error:                 return "I/O error";
            case VaultErrc::invalid_input:            return "Invalid input";
            case VaultErrc::secret_store_unavailable: return "Secret store unavailable";
            case VaultErrc::server_error:             return "Server error";
            default:                                  return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::VaultErrcCategory& vault_errc_category() noexcept {
    static detail::VaultErrcCategory category;
    return category;
}

inline std::error_code make_error_code(VaultErrc e) noexcept {
    return {static_cast<int>(e), vault_errc_category()};
}

// Error value returned through Result<T>. The payload fields are only
// meaningful for the codes that define them.
class Error {
public:
    Error() = default;
    Error(std::error_code code, std::string detail = {});
    Error(VaultErrc code, std::string detail = {});

    [[nodiscard]] static Error insufficient_disk_space(std::uint64_t required,
                                                      std::uint64_t available);
    [[nodiscard]] static Error download_interrupted(std::uint64_t bytes_downloaded,
                                                   std::uint64_t total_bytes,
                                                   std::string detail = {});
    [[nodiscard]] static Error http_status(std::int32_t status);

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    // Full message: category text plus detail
    [[nodiscard]] std::string message() const;

    // Stable category label for front ends
    [[nodiscard]] std::string_view category() const noexcept;

    // Whether retrying the same operation can succeed
    [[nodiscard]] bool recoverable() const noexcept;

    [[nodiscard]] std::string user_message() const;

    [[nodiscard]] bool is(VaultErrc e) const noexcept { return code_ == make_error_code(e); }

    std::uint64_t required{0};
    std::uint64_t available{0};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    std::int32_t http_status_code{0};

private:
    std::error_code code_;
    std::string detail_;
};

template<typename T>
using Result = std::expected<T, Error>;

} // namespace vault::core

namespace std {

template<>
struct is_error_code_enum<vault::core::VaultErrc> : true_type {};

} // namespace std
