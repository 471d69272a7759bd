// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace surge::disk {

// Positional writer shared by the chunk workers of one transfer.
// Writes to disjoint offsets need no locking.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open or create; existing content is kept unless truncate is set
    [[nodiscard]] std::error_code open(std::string_view path, bool truncate = false) noexcept;

    // Write data at offset (thread-safe)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Cut or extend the file to size bytes
    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::atomic<int> fd_{-1};
    std::string path_;
};

// Current size of a file, 0 when it does not exist
[[nodiscard]] std::uint64_t file_size_or_zero(std::string_view path) noexcept;

// Replace `to` with `from` in one step
[[nodiscard]] std::error_code rename_over(std::string_view from, std::string_view to) noexcept;

// Delete if present; missing files are not an error
[[nodiscard]] std::error_code remove_if_exists(std::string_view path) noexcept;

} // namespace surge::disk
