// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace vault::disk {

// errno conditions surfaced by the POSIX file layer
enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    file_exists,
    is_directory,
    too_many_open_files,
    write_error,
    read_error,
    sync_error,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "vault::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:              return "Success";
            case DiskErrc::file_not_found:       return "No such file or directory";
            case DiskErrc::access_denied:        return "Permission denied";
            case DiskErrc::disk_full:            return "No space left on the vault volume";
            case DiskErrc::invalid_path:         return "Path is malformed or too long";
            case DiskErrc::file_exists:          return "File exists";
            case DiskErrc::is_directory:         return "Path is a directory";
            case DiskErrc::too_many_open_files:  return "Too many open files";
            case DiskErrc::write_error:          return "Write failed";
            case DiskErrc::read_error:           return "Read failed";
            case DiskErrc::sync_error:           return "fsync failed";
            case DiskErrc::handle_invalid:       return "File is not open";
        }
        return "Unknown disk error";
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map errno after a failed syscall. Unlisted values become write_error.
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace vault::disk

namespace std {

template<>
struct is_error_code_enum<vault::disk::DiskErrc> : true_type {};

} // namespace std
