// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/url.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace surge::core {

// Task state machine
enum class TaskStatus : std::uint8_t {
    queued,      // Waiting for a permit
    resolving,   // Probing metadata
    downloading, // Transferring
    paused,      // Stopped by user, resumable
    completed,   // Verified and renamed into place
    failed,      // Gave up, error() says why
    cancelled    // Stopped by user, removed
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::optional<TaskStatus> parse_status(std::string_view text) noexcept;
[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

enum class TransferMode : std::uint8_t {
    chunked,
    single_stream
};

// Cooperative stop flag. Workers poll it at every buffer boundary.
class CancelToken {
public:
    void request() noexcept { requested_.store(true, std::memory_order_release); }
    [[nodiscard]] bool requested() const noexcept { return requested_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> requested_{false};
};

// Per-task transfer tuning, given at enqueue or through Scheduler::reconfigure
struct TransferOverrides {
    bool force_single_stream{false};
    std::uint32_t max_workers{0};  // Cap on chunk workers; 0: no cap

    bool operator==(const TransferOverrides&) const = default;
};

// Immutable view of a task for telemetry and listings
struct TaskSnapshot {
    std::string id;
    std::string url;
    std::string resolved_url;
    std::string destination;
    std::string filename;
    std::string category;
    TaskStatus status{TaskStatus::queued};
    double percent{0.0};
    double speed_bps{0.0};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t verified_bytes{0};
    std::uint64_t total_bytes{0};
    std::string error;
    // Diagnostics
    std::uint32_t attempts{0};
    std::uint32_t stall_count{0};
    std::int32_t http_status_last{0};
};

// Flat persisted form of a task
struct TaskRecord {
    std::string id;
    std::string url;
    std::string resolved_url;
    std::string destination;
    std::string filename;
    bool caller_filename{false};
    std::string final_path;
    std::string temp_path;
    TaskStatus status{TaskStatus::queued};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t verified_bytes{0};
    std::uint64_t total_bytes{0};
    bool accepts_ranges{false};
    TransferMode mode{TransferMode::chunked};
    std::set<std::uint32_t> completed_chunks;
    Headers headers;
    std::string provider_hint;
    std::string format_id;
    std::string error;
    TransferOverrides overrides;
    std::uint32_t chunk_workers{0};
};

// UI grouping by extension: Compressed, Programs, Video, Music or General
[[nodiscard]] std::string category_for(std::string_view filename);

// "12.3 MB"; totals of 0 render as "--- MB" through format_total
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_total(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(double bytes_per_sec);

// What a caller asks for
struct TransferRequest {
    std::string url;
    std::string destination;    // Empty: engine default
    std::string filename;       // Empty: resolved from the server
    Headers headers;
    std::string provider_hint;  // "http", "media" or empty for automatic
    std::string format_id;      // Passed to the media delegate
    TransferOverrides overrides;
};

// One requested transfer. Shared between the scheduler and the worker
// threads; every mutable field is behind one of the locks below.
class Task {
public:
    using clock = std::chrono::steady_clock;

    Task(std::string id, Url url, std::string destination);
    Task(std::string id, Url url, const TransferRequest& request);

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] static std::shared_ptr<Task> from_record(const TaskRecord& record);
    [[nodiscard]] TaskRecord record() const;
    [[nodiscard]] TaskSnapshot snapshot() const;

    // Identity, fixed at construction
    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const Url& url() const noexcept { return url_; }
    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::string& provider_hint() const noexcept { return provider_hint_; }
    [[nodiscard]] const std::string& format_id() const noexcept { return format_id_; }

    // Resolved metadata
    [[nodiscard]] std::string resolved_url() const;
    void resolved_url(std::string url);
    [[nodiscard]] std::string filename() const;
    void filename(std::string name);
    [[nodiscard]] bool filename_resolved() const;
    // Filename came with the request rather than from the server
    [[nodiscard]] bool caller_filename() const noexcept { return caller_filename_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_.load(std::memory_order_acquire); }
    void total_size(std::uint64_t size) noexcept { total_size_.store(size, std::memory_order_release); }
    [[nodiscard]] bool accepts_ranges() const noexcept { return accepts_ranges_.load(std::memory_order_acquire); }
    void accepts_ranges(bool value) noexcept { accepts_ranges_.store(value, std::memory_order_release); }
    [[nodiscard]] bool resolved() const;
    void clear_resolution();

    // Artifact locations
    [[nodiscard]] std::string final_path() const;
    void final_path(std::string path);
    [[nodiscard]] std::string temp_path() const;
    void temp_path(std::string path);

    // UI counter, bumped for every received buffer
    void mark_progress(std::uint64_t bytes) noexcept;
    [[nodiscard]] std::uint64_t downloaded() const noexcept;

    // Authoritative counter; rejects increments past a known total
    [[nodiscard]] std::error_code mark_verified(std::uint64_t bytes) noexcept;
    [[nodiscard]] std::error_code mark_chunk_verified(std::uint32_t index, std::uint64_t bytes) noexcept;
    [[nodiscard]] std::uint64_t verified() const noexcept;
    [[nodiscard]] std::set<std::uint32_t> completed_chunks() const;

    // Zero both counters and forget completed chunks
    void reset_counters() noexcept;
    // Drop progress that never reached verification
    void rewind_progress_to_verified() noexcept;

    [[nodiscard]] TransferMode mode() const noexcept { return mode_.load(std::memory_order_acquire); }
    void mode(TransferMode m) noexcept { mode_.store(m, std::memory_order_release); }

    // Worker count of the plan the completed chunks belong to; 0 if unknown
    [[nodiscard]] std::uint32_t chunk_workers() const noexcept { return chunk_workers_.load(std::memory_order_acquire); }
    void chunk_workers(std::uint32_t n) noexcept { chunk_workers_.store(n, std::memory_order_release); }

    [[nodiscard]] TransferOverrides overrides() const;
    void overrides(TransferOverrides value);

    // Cancellation: one token per attempt
    void request_cancel() noexcept;
    [[nodiscard]] std::shared_ptr<CancelToken> cancel_token() const;
    std::shared_ptr<CancelToken> rearm();

    // Held by the worker for the whole attempt
    [[nodiscard]] std::mutex& attempt_mutex() noexcept { return attempt_mutex_; }

    [[nodiscard]] TaskStatus status() const;
    // Apply a transition if the state machine allows it
    bool transition(TaskStatus to);
    // Apply only when the current status is `from`
    bool transition_from(TaskStatus from, TaskStatus to);

    [[nodiscard]] std::string error() const;
    void error(std::string message);

    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_.load(std::memory_order_relaxed); }
    void begin_attempt() noexcept { attempts_.fetch_add(1, std::memory_order_relaxed); }
    [[nodiscard]] std::int32_t last_http_status() const noexcept { return last_http_status_.load(std::memory_order_relaxed); }
    void last_http_status(std::int32_t code) noexcept { last_http_status_.store(code, std::memory_order_relaxed); }
    // Failed requests that were retried
    [[nodiscard]] std::uint32_t stall_count() const noexcept { return stall_count_.load(std::memory_order_relaxed); }
    void note_stall() noexcept { stall_count_.fetch_add(1, std::memory_order_relaxed); }

    // Fold the bytes received since the previous sample into the speed EMA
    void sample_speed(clock::time_point now) noexcept;
    void reset_speed_metrics(clock::time_point now) noexcept;
    [[nodiscard]] double speed() const noexcept;
    [[nodiscard]] clock::time_point last_sample_time() const noexcept;

private:
    const std::string id_;
    const Url url_;
    const std::string destination_;
    Headers headers_;
    std::string provider_hint_;
    std::string format_id_;
    bool caller_filename_{false};

    std::atomic<std::uint64_t> total_size_{0};
    std::atomic<bool> accepts_ranges_{false};
    std::atomic<TransferMode> mode_{TransferMode::chunked};
    std::atomic<std::uint32_t> attempts_{0};
    std::atomic<std::int32_t> last_http_status_{0};
    std::atomic<std::uint32_t> stall_count_{0};
    std::atomic<std::uint32_t> chunk_workers_{0};

    // Status, names, paths, error, overrides, token
    mutable std::mutex meta_mutex_;
    TaskStatus status_{TaskStatus::queued};
    std::string resolved_url_;
    std::string filename_;
    bool filename_resolved_{false};
    std::string final_path_;
    std::string temp_path_;
    std::string error_;
    TransferOverrides overrides_;
    std::shared_ptr<CancelToken> token_;

    // downloaded_ and the speed sample; hot path of every buffer
    mutable std::mutex progress_mutex_;
    std::uint64_t downloaded_{0};
    double speed_bps_{0.0};
    clock::time_point last_sample_time_;
    std::uint64_t last_sample_bytes_{0};

    // verified_ and the completed chunk set
    mutable std::mutex verify_mutex_;
    std::uint64_t verified_{0};
    std::set<std::uint32_t> completed_chunks_;

    std::mutex attempt_mutex_;
};

} // namespace surge::core
