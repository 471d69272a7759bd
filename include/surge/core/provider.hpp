// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/task.hpp>
#include <surge/core/url.hpp>
#include <chrono>
#include <functional>
#include <string_view>
#include <system_error>

namespace surge::core {

// Callbacks a provider uses to report back while it transfers.
// Both may be called from several threads at once.
struct TransferHooks {
    std::function<void(Task&)> progress;    // Counters moved; throttled by the receiver
    std::function<void(Task&)> checkpoint;  // Durable progress; persist now
};

struct RetryPolicy {
    std::uint32_t chunk_attempts{RETRY_COUNT};
    std::uint32_t stream_attempts{RETRY_COUNT};
    std::chrono::milliseconds backoff_unit{RETRY_BACKOFF_UNIT};
};

// Transfer strategy for one family of URLs.
//
// resolve() fills in the resolved URL, size, range support, filename and
// artifact paths. download() moves bytes and returns success once the
// payload is on disk; it never marks the task Completed. A requested token
// makes both return DownloadErrc::cancelled promptly. Failure details go
// to task.error().
class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual bool can_handle(const Url& url) const noexcept = 0;

    [[nodiscard]] virtual std::error_code resolve(Task& task, const CancelToken& token) noexcept = 0;

    [[nodiscard]] virtual std::error_code download(Task& task,
                                                   const CancelToken& token,
                                                   const TransferHooks& hooks) noexcept = 0;

    // True when a paused transfer continues from verified state
    [[nodiscard]] virtual bool resumable() const noexcept = 0;

    // Delete partial output of the task
    virtual void discard(Task& task) noexcept = 0;
};

// Sleep in small steps; false when the token was requested meanwhile
[[nodiscard]] bool sleep_unless_cancelled(const CancelToken& token,
                                          std::chrono::milliseconds duration) noexcept;

} // namespace surge::core
