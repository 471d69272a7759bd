// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/error.hpp>
#include <surge/core/provider.hpp>
#include <surge/core/state_store.hpp>
#include <surge/core/task.hpp>
#include <surge/core/telemetry.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace surge::core {

// Upper bound for EngineConfig::max_active
constexpr std::ptrdiff_t MAX_ACTIVE_LIMIT = 64;

// Media provider first (host list), ranged HTTP as the catch-all
[[nodiscard]] std::vector<std::shared_ptr<Provider>> make_default_providers(const EngineConfig& config);

// Owns every task: queues them, runs at most max_active at once, applies
// control operations, throttles telemetry and persists state.
class Scheduler {
public:
    explicit Scheduler(EngineConfig config,
                       std::shared_ptr<TelemetrySink> sink = nullptr);
    Scheduler(EngineConfig config,
              std::shared_ptr<TelemetrySink> sink,
              std::vector<std::shared_ptr<Provider>> providers);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Create a Queued task and return its id
    [[nodiscard]] std::expected<std::string, std::error_code> enqueue(TransferRequest request);

    [[nodiscard]] std::error_code pause(std::string_view id);
    [[nodiscard]] std::error_code resume(std::string_view id);
    [[nodiscard]] std::error_code cancel(std::string_view id);
    [[nodiscard]] std::error_code retry(std::string_view id);
    // Replace the transfer overrides of a task and run it again with them.
    // Active tasks are paused first; Failed tasks start a fresh cycle.
    [[nodiscard]] std::error_code reconfigure(std::string_view id, TransferOverrides overrides);
    // Forget a Completed or Failed task; files stay
    [[nodiscard]] std::error_code remove(std::string_view id);

    [[nodiscard]] std::vector<TaskSnapshot> list() const;
    [[nodiscard]] std::optional<TaskSnapshot> get(std::string_view id) const;

    // Wait until no task is Queued, Resolving or Downloading and every
    // worker exited. False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    // Stop dispatching, pause active tasks, join workers, persist
    void shutdown();

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void load_state();
    void dispatch_loop(std::stop_token stop);
    void push_queue(const std::string& id);
    void reap_workers();

    void run_task(const std::shared_ptr<Task>& task);
    // Mark the task thread gone; requeue a task resumed meanwhile
    void release(const Task& task);
    void run_attempt(Task& task, Provider& provider, const CancelToken& token);
    void finalize(Task& task, Provider& provider);
    void fail(Task& task, std::error_code ec);

    [[nodiscard]] std::shared_ptr<Task> find(std::string_view id) const;
    [[nodiscard]] Provider* select_provider(const Task& task) const;

    // Event for a task; unforced events are throttled to emit_interval
    void publish(Task& task, bool force);
    void persist();
    [[nodiscard]] TransferHooks hooks_for();

    [[nodiscard]] static std::string generate_id();

    EngineConfig config_;
    std::shared_ptr<TelemetrySink> sink_;
    std::vector<std::shared_ptr<Provider>> providers_;
    std::unique_ptr<StateStore> store_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Task>> tasks_;
    std::deque<std::string> queue_;
    std::set<std::string> running_;  // Ids with a live task thread
    std::condition_variable_any queue_cv_;

    std::mutex emit_mutex_;
    std::map<std::string, Task::clock::time_point> last_emit_;

    std::mutex persist_mutex_;

    std::counting_semaphore<MAX_ACTIVE_LIMIT> permits_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    std::atomic<bool> stopped_{false};
    std::jthread dispatcher_;  // Last: started once everything above exists
};

} // namespace surge::core
