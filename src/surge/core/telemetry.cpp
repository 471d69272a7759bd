// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/telemetry.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace surge::core {

bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::completed
        || status == TaskStatus::failed
        || status == TaskStatus::cancelled;
}

//=============================================================================
// CallbackSink
//=============================================================================

CallbackSink::CallbackSink(Callback callback)
    : callback_(std::move(callback)) {}

void CallbackSink::emit(const TaskSnapshot& snapshot) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!callback_) {
        return;
    }
    try {
        callback_(snapshot);
    } catch (const std::exception& e) {
        spdlog::warn("Telemetry callback threw for task {}: {}", snapshot.id, e.what());
    }
}

//=============================================================================
// BufferedSink
//=============================================================================

BufferedSink::BufferedSink(std::shared_ptr<TelemetrySink> downstream, std::size_t capacity)
    : downstream_(std::move(downstream))
    , capacity_(capacity > 0 ? capacity : 1)
    , thread_([this](std::stop_token stop) { deliver_loop(stop); }) {}

BufferedSink::~BufferedSink() {
    thread_.request_stop();
    ready_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void BufferedSink::emit(const TaskSnapshot& snapshot) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            auto victim = std::find_if(queue_.begin(), queue_.end(),
                [](const TaskSnapshot& s) { return !is_terminal(s.status); });
            if (victim != queue_.end()) {
                queue_.erase(victim);
                ++dropped_;
            } else if (!is_terminal(snapshot.status)) {
                // Queue holds only terminal events; the newcomer yields
                ++dropped_;
                return;
            }
        }
        queue_.push_back(snapshot);
    } catch (const std::exception& e) {
        spdlog::warn("Telemetry event for task {} lost: {}", snapshot.id, e.what());
        return;
    }
    ready_cv_.notify_one();
}

void BufferedSink::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

std::size_t BufferedSink::dropped() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void BufferedSink::deliver_loop(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        ready_cv_.wait(lock, stop, [this] { return !queue_.empty(); });
        if (queue_.empty()) {
            // Stop requested and nothing left to deliver
            break;
        }

        auto snapshot = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        if (downstream_) {
            downstream_->emit(snapshot);
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            drained_cv_.notify_all();
        }
    }
    drained_cv_.notify_all();
}

//=============================================================================
// Wire format
//=============================================================================

void to_json(nlohmann::json& j, const TaskSnapshot& snapshot) {
    j = nlohmann::json{
        {"id", snapshot.id},
        {"url", snapshot.url},
        {"filename", snapshot.filename},
        {"status", std::string(to_string(snapshot.status))},
        {"progress", std::round(snapshot.percent * 10.0) / 10.0},
        {"speed", format_speed(snapshot.speed_bps)},
        {"speed_bps", snapshot.speed_bps},
        {"downloaded", format_bytes(snapshot.downloaded_bytes)},
        {"total", format_total(snapshot.total_bytes)},
        {"raw_downloaded", snapshot.downloaded_bytes},
        {"raw_total", snapshot.total_bytes},
        {"raw_verified", snapshot.verified_bytes},
        {"category", snapshot.category},
        {"path", snapshot.destination},
        {"real_url", snapshot.resolved_url},
        {"error", snapshot.error},
        {"attempts", snapshot.attempts},
        {"stall_count", snapshot.stall_count},
        {"http_status_last", snapshot.http_status_last},
    };
}

} // namespace surge::core
