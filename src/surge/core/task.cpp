// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/task.hpp>
#include <surge/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace surge::core {

namespace {

constexpr double SPEED_SMOOTHING = 0.3;  // Weight of the newest sample

struct CategoryRule {
    std::string_view category;
    std::array<std::string_view, 4> extensions;
};

constexpr std::array<CategoryRule, 4> CATEGORY_RULES{{
    {"Compressed", {"zip", "rar", "7z", "iso"}},
    {"Programs",   {"exe", "msi", "apk", ""}},
    {"Video",      {"mp4", "mkv", "avi", "mov"}},
    {"Music",      {"mp3", "wav", "flac", ""}},
}};

} // namespace

//=============================================================================
// Status helpers
//=============================================================================

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::queued:      return "Queued";
        case TaskStatus::resolving:   return "Resolving";
        case TaskStatus::downloading: return "Downloading";
        case TaskStatus::paused:      return "Paused";
        case TaskStatus::completed:   return "Completed";
        case TaskStatus::failed:      return "Failed";
        case TaskStatus::cancelled:   return "Cancelled";
    }
    return "Unknown";
}

std::optional<TaskStatus> parse_status(std::string_view text) noexcept {
    for (auto s : {TaskStatus::queued, TaskStatus::resolving, TaskStatus::downloading,
                   TaskStatus::paused, TaskStatus::completed, TaskStatus::failed,
                   TaskStatus::cancelled}) {
        if (to_string(s) == text) {
            return s;
        }
    }
    return std::nullopt;
}

bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    using enum TaskStatus;
    switch (from) {
        case queued:
            return to == resolving || to == downloading || to == paused || to == cancelled;
        case resolving:
            return to == downloading || to == failed || to == paused || to == cancelled;
        case downloading:
            return to == paused || to == completed || to == failed || to == cancelled;
        case paused:
            return to == queued || to == downloading || to == cancelled;
        case failed:
            return to == queued || to == cancelled;
        case completed:
        case cancelled:
            return false;
    }
    return false;
}

std::string category_for(std::string_view filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == filename.size()) {
        return "General";
    }

    std::string ext;
    for (char c : filename.substr(dot + 1)) {
        ext += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& rule : CATEGORY_RULES) {
        for (auto candidate : rule.extensions) {
            if (!candidate.empty() && candidate == ext) {
                return std::string(rule.category);
            }
        }
    }
    return "General";
}

std::string format_bytes(std::uint64_t bytes) {
    return std::format("{:.1f} MB", static_cast<double>(bytes) / static_cast<double>(MiB));
}

std::string format_total(std::uint64_t bytes) {
    return bytes > 0 ? format_bytes(bytes) : std::string("--- MB");
}

std::string format_speed(double bytes_per_sec) {
    return std::format("{:.2f} MB/s", bytes_per_sec / static_cast<double>(MiB));
}

//=============================================================================
// Task
//=============================================================================

Task::Task(std::string id, Url url, std::string destination)
    : id_(std::move(id))
    , url_(std::move(url))
    , destination_(std::move(destination))
    , token_(std::make_shared<CancelToken>())
    , last_sample_time_(clock::now()) {}

Task::Task(std::string id, Url url, const TransferRequest& request)
    : Task(std::move(id), std::move(url), request.destination) {
    headers_ = request.headers;
    provider_hint_ = request.provider_hint;
    format_id_ = request.format_id;
    overrides_ = request.overrides;
    if (!request.filename.empty()) {
        filename_ = request.filename;
        filename_resolved_ = true;
        caller_filename_ = true;
    }
}

std::shared_ptr<Task> Task::from_record(const TaskRecord& record) {
    auto url = Url::parse(record.url);
    if (!url) {
        return nullptr;
    }

    TransferRequest request;
    request.destination = record.destination;
    request.filename = record.filename;
    request.headers = record.headers;
    request.provider_hint = record.provider_hint;
    request.format_id = record.format_id;
    request.overrides = record.overrides;

    auto task = std::make_shared<Task>(record.id, std::move(*url), request);
    task->caller_filename_ = record.caller_filename;
    task->resolved_url_ = record.resolved_url;
    task->final_path_ = record.final_path;
    task->temp_path_ = record.temp_path;
    task->status_ = record.status;
    task->error_ = record.error;
    task->total_size_.store(record.total_bytes);
    task->accepts_ranges_.store(record.accepts_ranges);
    task->mode_.store(record.mode);
    task->chunk_workers_.store(record.chunk_workers);
    task->verified_ = std::min(record.verified_bytes, record.total_bytes > 0
                                                          ? record.total_bytes
                                                          : record.verified_bytes);
    task->completed_chunks_ = record.completed_chunks;
    task->downloaded_ = record.downloaded_bytes;
    task->last_sample_bytes_ = record.downloaded_bytes;
    return task;
}

TaskRecord Task::record() const {
    TaskRecord r;
    r.id = id_;
    r.url = url_.str();
    r.destination = destination_;
    r.headers = headers_;
    r.provider_hint = provider_hint_;
    r.format_id = format_id_;
    r.caller_filename = caller_filename_;
    r.total_bytes = total_size();
    r.accepts_ranges = accepts_ranges();
    r.mode = mode();
    r.chunk_workers = chunk_workers();
    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        r.overrides = overrides_;
        r.resolved_url = resolved_url_;
        r.filename = filename_;
        r.final_path = final_path_;
        r.temp_path = temp_path_;
        r.status = status_;
        r.error = error_;
    }
    r.downloaded_bytes = downloaded();
    {
        std::lock_guard<std::mutex> lock(verify_mutex_);
        r.verified_bytes = verified_;
        r.completed_chunks = completed_chunks_;
    }
    return r;
}

TaskSnapshot Task::snapshot() const {
    TaskSnapshot snap;
    snap.id = id_;
    snap.url = url_.str();
    snap.destination = destination_;
    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        snap.resolved_url = resolved_url_;
        snap.filename = filename_;
        snap.status = status_;
        snap.error = error_;
    }
    snap.category = category_for(snap.filename);
    snap.attempts = attempts();
    snap.stall_count = stall_count();
    snap.http_status_last = last_http_status();
    snap.total_bytes = total_size();
    snap.verified_bytes = verified();
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        snap.downloaded_bytes = downloaded_;
        snap.speed_bps = snap.status == TaskStatus::downloading ? speed_bps_ : 0.0;
    }

    if (snap.status == TaskStatus::completed) {
        snap.percent = 100.0;
    } else if (snap.total_bytes > 0) {
        snap.percent = std::min(100.0, static_cast<double>(snap.downloaded_bytes) * 100.0
                                           / static_cast<double>(snap.total_bytes));
    }
    return snap;
}

std::string Task::resolved_url() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return resolved_url_;
}

void Task::resolved_url(std::string url) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    resolved_url_ = std::move(url);
}

std::string Task::filename() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return filename_;
}

void Task::filename(std::string name) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    filename_ = std::move(name);
    filename_resolved_ = !filename_.empty();
}

bool Task::filename_resolved() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return filename_resolved_;
}

bool Task::resolved() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return !resolved_url_.empty() && filename_resolved_;
}

void Task::clear_resolution() {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    resolved_url_.clear();
    total_size_.store(0, std::memory_order_release);
    accepts_ranges_.store(false, std::memory_order_release);
    mode_.store(TransferMode::chunked, std::memory_order_release);
}

TransferOverrides Task::overrides() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return overrides_;
}

void Task::overrides(TransferOverrides value) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    overrides_ = value;
}

std::string Task::final_path() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return final_path_;
}

void Task::final_path(std::string path) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    final_path_ = std::move(path);
}

std::string Task::temp_path() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return temp_path_;
}

void Task::temp_path(std::string path) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    temp_path_ = std::move(path);
}

void Task::mark_progress(std::uint64_t bytes) noexcept {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    downloaded_ += bytes;
}

std::uint64_t Task::downloaded() const noexcept {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return downloaded_;
}

std::error_code Task::mark_verified(std::uint64_t bytes) noexcept {
    std::lock_guard<std::mutex> lock(verify_mutex_);
    auto total = total_size();
    if (total > 0 && verified_ + bytes > total) {
        return make_error_code(DownloadErrc::invalid_range);
    }
    verified_ += bytes;
    return {};
}

std::error_code Task::mark_chunk_verified(std::uint32_t index, std::uint64_t bytes) noexcept {
    std::lock_guard<std::mutex> lock(verify_mutex_);
    if (completed_chunks_.contains(index)) {
        return make_error_code(DownloadErrc::invalid_range);
    }
    auto total = total_size();
    if (total > 0 && verified_ + bytes > total) {
        return make_error_code(DownloadErrc::invalid_range);
    }
    verified_ += bytes;
    completed_chunks_.insert(index);
    return {};
}

std::uint64_t Task::verified() const noexcept {
    std::lock_guard<std::mutex> lock(verify_mutex_);
    return verified_;
}

std::set<std::uint32_t> Task::completed_chunks() const {
    std::lock_guard<std::mutex> lock(verify_mutex_);
    return completed_chunks_;
}

void Task::reset_counters() noexcept {
    {
        std::lock_guard<std::mutex> lock(verify_mutex_);
        verified_ = 0;
        completed_chunks_.clear();
    }
    chunk_workers_.store(0, std::memory_order_release);
    std::lock_guard<std::mutex> lock(progress_mutex_);
    downloaded_ = 0;
    last_sample_bytes_ = 0;
}

void Task::rewind_progress_to_verified() noexcept {
    auto v = verified();
    std::lock_guard<std::mutex> lock(progress_mutex_);
    downloaded_ = v;
    last_sample_bytes_ = v;
}

void Task::request_cancel() noexcept {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    token_->request();
}

std::shared_ptr<CancelToken> Task::cancel_token() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return token_;
}

std::shared_ptr<CancelToken> Task::rearm() {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    token_ = std::make_shared<CancelToken>();
    return token_;
}

TaskStatus Task::status() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return status_;
}

bool Task::transition(TaskStatus to) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    if (!can_transition(status_, to)) {
        return false;
    }
    status_ = to;
    return true;
}

bool Task::transition_from(TaskStatus from, TaskStatus to) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    if (status_ != from || !can_transition(from, to)) {
        return false;
    }
    status_ = to;
    return true;
}

std::string Task::error() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return error_;
}

void Task::error(std::string message) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    error_ = std::move(message);
}

void Task::sample_speed(clock::time_point now) noexcept {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    auto delta_t = std::chrono::duration<double>(now - last_sample_time_).count();
    // Counter resets make the delta negative; treat as no progress
    std::uint64_t delta_b = downloaded_ > last_sample_bytes_ ? downloaded_ - last_sample_bytes_ : 0;

    if (delta_t > 0.0) {
        double inst = static_cast<double>(delta_b) / delta_t;
        speed_bps_ = speed_bps_ > 0.0
            ? speed_bps_ * (1.0 - SPEED_SMOOTHING) + inst * SPEED_SMOOTHING
            : inst;
    }
    last_sample_time_ = now;
    last_sample_bytes_ = downloaded_;
}

void Task::reset_speed_metrics(clock::time_point now) noexcept {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    last_sample_time_ = now;
    last_sample_bytes_ = downloaded_;
    speed_bps_ = 0.0;
}

double Task::speed() const noexcept {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return speed_bps_;
}

Task::clock::time_point Task::last_sample_time() const noexcept {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return last_sample_time_;
}

} // namespace surge::core
