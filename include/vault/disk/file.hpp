// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace vault::disk {

// POSIX file handle wrapper
class File {
public:
    // Open an existing file read-only
    static std::expected<File, std::error_code>
    open_read(std::string_view path) noexcept;

    // Open for appending, creating the file if missing
    static std::expected<File, std::error_code>
    open_append(std::string_view path) noexcept;

    // Create or truncate for writing
    static std::expected<File, std::error_code>
    create(std::string_view path) noexcept;

    // Create a new file, failing with file_exists if it is already present
    static std::expected<File, std::error_code>
    create_exclusive(std::string_view path) noexcept;

    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&&) noexcept;
    File& operator=(File&&) noexcept;

    // Positional read. Returns fewer bytes than requested only at end of file.
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read_at(std::uint64_t offset, void* buffer, std::size_t size) noexcept;

    // Sequential read from the current position
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(void* buffer, std::size_t size) noexcept;

    // Write the whole buffer at the current position
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    File() = default;

    static std::expected<File, std::error_code>
    open_with(std::string_view path, int flags) noexcept;

    int fd_{-1};
    std::string path_;
};

} // namespace vault::disk
