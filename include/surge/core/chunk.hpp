// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <vector>

namespace surge::core {

// One byte range of a chunked transfer, inclusive on both ends
struct ChunkRange {
    std::uint32_t index{0};
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return last - first + 1; }

    auto operator<=>(const ChunkRange&) const = default;
};

// Parallel requests for a transfer of `size` bytes.
// Returns 1 without range support or with an unknown size.
[[nodiscard]] std::uint32_t worker_count_for(std::uint64_t size, bool range_supported) noexcept;

// Split [0, size) into `workers` contiguous ranges; the last one takes the
// remainder. Deterministic so a resumed transfer gets the same plan.
[[nodiscard]] std::vector<ChunkRange> plan_chunks(std::uint64_t size, std::uint32_t workers);

} // namespace surge::core
