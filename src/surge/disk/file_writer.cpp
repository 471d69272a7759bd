// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>

namespace surge::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(std::string_view path, bool truncate) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }

    int fd = ::open(path_.c_str(), flags, 0644);
    if (fd < 0) {
        return from_errno(errno);
    }
    fd_.store(fd, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    // pwrite may write less than asked; loop until done
    const auto* bytes = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::pwrite(fd, bytes + written, size - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return from_errno(errno);
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return from_errno(errno);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd) != 0) {
        return from_errno(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    // Atomic guard against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

//=============================================================================
// Path helpers
//=============================================================================

std::uint64_t file_size_or_zero(std::string_view path) noexcept {
    try {
        struct stat st{};
        if (::stat(std::string(path).c_str(), &st) != 0) {
            return 0;
        }
        return static_cast<std::uint64_t>(st.st_size);
    } catch (const std::bad_alloc&) {
        return 0;
    }
}

std::error_code rename_over(std::string_view from, std::string_view to) noexcept {
    try {
        if (std::rename(std::string(from).c_str(), std::string(to).c_str()) != 0) {
            return errno == ENOENT ? make_error_code(DiskErrc::file_not_found)
                                   : make_error_code(DiskErrc::rename_failed);
        }
        return {};
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::rename_failed);
    }
}

std::error_code remove_if_exists(std::string_view path) noexcept {
    try {
        if (::unlink(std::string(path).c_str()) != 0 && errno != ENOENT) {
            return from_errno(errno);
        }
        return {};
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
}

} // namespace surge::disk
