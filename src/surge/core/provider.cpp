// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/provider.hpp>
#include <algorithm>
#include <thread>

namespace surge::core {

bool sleep_unless_cancelled(const CancelToken& token, std::chrono::milliseconds duration) noexcept {
    constexpr std::chrono::milliseconds STEP{50};
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!token.requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(STEP, deadline - now));
    }
    return false;
}

} // namespace surge::core
