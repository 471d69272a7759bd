// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/task.hpp>
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace surge::core {

// Receives task events. emit() may be called from any thread.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual void emit(const TaskSnapshot& snapshot) noexcept = 0;
};

// Completed, Failed and Cancelled events are never dropped
[[nodiscard]] bool is_terminal(TaskStatus status) noexcept;

// Calls a function synchronously on the emitting thread
class CallbackSink final : public TelemetrySink {
public:
    using Callback = std::function<void(const TaskSnapshot&)>;

    explicit CallbackSink(Callback callback);

    void emit(const TaskSnapshot& snapshot) noexcept override;

private:
    std::mutex mutex_;  // Serializes calls into the callback
    Callback callback_;
};

// Decouples emitters from a slow consumer. Events queue up to `capacity`;
// when full the oldest non-terminal event makes room. Delivery happens on
// a dedicated thread.
class BufferedSink final : public TelemetrySink {
public:
    BufferedSink(std::shared_ptr<TelemetrySink> downstream, std::size_t capacity = 256);
    ~BufferedSink() override;

    BufferedSink(const BufferedSink&) = delete;
    BufferedSink& operator=(const BufferedSink&) = delete;

    void emit(const TaskSnapshot& snapshot) noexcept override;

    // Block until everything queued so far was delivered
    void flush();

    [[nodiscard]] std::size_t dropped() const noexcept;

private:
    void deliver_loop(std::stop_token stop);

    std::shared_ptr<TelemetrySink> downstream_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable_any ready_cv_;
    std::condition_variable drained_cv_;
    std::deque<TaskSnapshot> queue_;
    bool delivering_{false};
    std::size_t dropped_{0};

    std::jthread thread_;  // Last: joins before the members above go away
};

// Event wire format
void to_json(nlohmann::json& j, const TaskSnapshot& snapshot);

} // namespace surge::core
