// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/disk/file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vault::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:
        case ENOTDIR:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case EINVAL:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EISDIR:        return make_error_code(DiskErrc::is_directory);
        case EMFILE:
        case ENFILE:        return make_error_code(DiskErrc::too_many_open_files);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        case EIO:           return make_error_code(DiskErrc::read_error);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// File
//=============================================================================

std::expected<File, std::error_code>
File::open_with(std::string_view path, int flags) noexcept {
    File file;
    file.path_ = path;

    do {
        file.fd_ = ::open(file.path_.c_str(), flags | O_CLOEXEC, 0644);
    } while (file.fd_ < 0 && errno == EINTR);

    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return file;
}

std::expected<File, std::error_code>
File::open_read(std::string_view path) noexcept {
    return open_with(path, O_RDONLY);
}

std::expected<File, std::error_code>
File::open_append(std::string_view path) noexcept {
    return open_with(path, O_WRONLY | O_CREAT | O_APPEND);
}

std::expected<File, std::error_code>
File::create(std::string_view path) noexcept {
    return open_with(path, O_WRONLY | O_CREAT | O_TRUNC);
}

std::expected<File, std::error_code>
File::create_exclusive(std::string_view path) noexcept {
    return open_with(path, O_WRONLY | O_CREAT | O_EXCL);
}

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<std::size_t, std::error_code>
File::read_at(std::uint64_t offset, void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    auto* out = static_cast<char*>(buffer);
    std::size_t total = 0;
    while (total < size) {
        ssize_t n = ::pread(fd_, out + total, size - total,
                            static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
        if (n == 0) break;
        total += static_cast<std::size_t>(n);
    }
    return total;
}

std::expected<std::size_t, std::error_code>
File::read(void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    auto* out = static_cast<char*>(buffer);
    std::size_t total = 0;
    while (total < size) {
        ssize_t n = ::read(fd_, out + total, size - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
        if (n == 0) break;
        total += static_cast<std::size_t>(n);
    }
    return total;
}

std::error_code File::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* in = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, in + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code File::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return ::fsync(fd_) == 0 ? std::error_code{} : make_error_code(DiskErrc::sync_error);
}

std::expected<std::uint64_t, std::error_code> File::size() const noexcept {
    struct stat st{};
    if (fd_ < 0 || ::fstat(fd_, &st) != 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void File::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace vault::disk
