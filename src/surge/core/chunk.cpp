// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk.hpp>
#include <surge/core/config.hpp>

namespace surge::core {

std::uint32_t worker_count_for(std::uint64_t size, bool range_supported) noexcept {
    if (!range_supported || size == 0) {
        return 1;
    }

    if (size > LARGE_FILE_THRESHOLD) {
        return LARGE_FILE_WORKERS;
    } else if (size > MEDIUM_FILE_THRESHOLD) {
        return MEDIUM_FILE_WORKERS;
    } else if (size > SMALL_FILE_THRESHOLD) {
        return SMALL_FILE_WORKERS;
    }
    return 1;
}

std::vector<ChunkRange> plan_chunks(std::uint64_t size, std::uint32_t workers) {
    std::vector<ChunkRange> chunks;
    if (size == 0) {
        return chunks;
    }

    // Never more chunks than bytes
    if (workers == 0) {
        workers = 1;
    }
    if (workers > size) {
        workers = static_cast<std::uint32_t>(size);
    }

    const std::uint64_t part = size / workers;
    chunks.reserve(workers);

    for (std::uint32_t i = 0; i < workers; ++i) {
        ChunkRange range;
        range.index = i;
        range.first = static_cast<std::uint64_t>(i) * part;
        range.last = (i + 1 == workers) ? size - 1 : (static_cast<std::uint64_t>(i) + 1) * part - 1;
        chunks.push_back(range);
    }
    return chunks;
}

} // namespace surge::core
