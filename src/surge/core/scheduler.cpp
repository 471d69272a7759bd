// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/scheduler.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/ranged_http_provider.hpp>
#include <surge/disk/file_writer.hpp>
#include <surge/media/process_media_delegate.hpp>
#include <surge/media/streaming_delegate_provider.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <random>

namespace surge::core {

namespace {

// Gives the concurrency permit back when the task thread exits
struct PermitGuard {
    std::counting_semaphore<MAX_ACTIVE_LIMIT>& permits;
    ~PermitGuard() { permits.release(); }
};

bool is_active(TaskStatus status) noexcept {
    return status == TaskStatus::queued
        || status == TaskStatus::resolving
        || status == TaskStatus::downloading;
}

} // namespace

std::vector<std::shared_ptr<Provider>> make_default_providers(const EngineConfig& config) {
    HttpOptions options;
    options.user_agent = config.user_agent;
    options.connect_timeout_sec = config.connect_timeout_sec;
    options.stall_timeout_sec = config.stall_timeout_sec;

    RetryPolicy policy;
    policy.chunk_attempts = config.chunk_attempts;
    policy.stream_attempts = config.stream_attempts;
    policy.backoff_unit = config.retry_backoff;

    return {
        std::make_shared<media::StreamingDelegateProvider>(
            std::make_shared<media::ProcessMediaDelegate>(config.media_tool), config.media_hosts),
        std::make_shared<RangedHttpProvider>(std::make_shared<HttpSession>(options), policy),
    };
}

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(EngineConfig config, std::shared_ptr<TelemetrySink> sink)
    : Scheduler(config, std::move(sink), make_default_providers(config)) {}

Scheduler::Scheduler(EngineConfig config,
                     std::shared_ptr<TelemetrySink> sink,
                     std::vector<std::shared_ptr<Provider>> providers)
    : config_(std::move(config))
    , sink_(std::move(sink))
    , providers_(std::move(providers))
    , permits_(std::clamp<std::ptrdiff_t>(config_.max_active, 1, MAX_ACTIVE_LIMIT)) {
    if (!config_.state_file.empty()) {
        store_ = std::make_unique<StateStore>(config_.state_file);
        load_state();
    }
    dispatcher_ = std::jthread([this](std::stop_token stop) { dispatch_loop(stop); });
}

Scheduler::~Scheduler() {
    shutdown();
}

void Scheduler::load_state() {
    auto records = store_->load();
    if (!records) {
        spdlog::error("State file {} unreadable ({}), starting empty",
                      store_->path(), records.error().message());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : *records) {
        auto task = Task::from_record(record);
        if (!task) {
            spdlog::warn("Skipping stored task {} with invalid URL {}", record.id, record.url);
            continue;
        }
        tasks_.emplace(task->id(), std::move(task));
    }
    spdlog::info("Restored {} task(s) from {}", tasks_.size(), store_->path());
}

std::string Scheduler::generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::format("{:016x}{:016x}", rng(), rng());
}

//=============================================================================
// Control operations
//=============================================================================

std::expected<std::string, std::error_code> Scheduler::enqueue(TransferRequest request) {
    if (stopped_.load(std::memory_order_acquire)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }

    auto url = Url::parse(request.url);
    if (!url || !url->is_http()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    if (request.destination.empty()) {
        request.destination = config_.download_dir;
    }
    if (!request.filename.empty()) {
        auto name = sanitize_filename(request.filename);
        if (name.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_filename));
        }
        if (name != request.filename) {
            spdlog::warn("Filename {} reduced to {}", request.filename, name);
        }
        request.filename = std::move(name);
    }

    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id;
        do {
            id = generate_id();
        } while (tasks_.contains(id));
        task = std::make_shared<Task>(std::move(id), std::move(*url), request);
        if (!select_provider(*task)) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        tasks_.emplace(task->id(), task);
    }

    spdlog::info("Task {} queued: {}", task->id(), request.url);
    persist();
    publish(*task, true);
    push_queue(task->id());
    return task->id();
}

std::error_code Scheduler::pause(std::string_view id) {
    auto task = find(id);
    if (!task) {
        return make_error_code(DownloadErrc::unknown_task);
    }
    if (!is_active(task->status()) || !task->transition(TaskStatus::paused)) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    task->request_cancel();

    spdlog::info("Task {} paused at {} verified bytes", task->id(), task->verified());
    publish(*task, true);
    persist();
    return {};
}

std::error_code Scheduler::resume(std::string_view id) {
    auto task = find(id);
    if (!task) {
        return make_error_code(DownloadErrc::unknown_task);
    }
    if (task->status() != TaskStatus::paused) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    // Fresh token first so the new attempt never sees the old request
    task->rearm();
    if (!task->transition_from(TaskStatus::paused, TaskStatus::queued)) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    task->error({});

    spdlog::info("Task {} resumed from {} verified bytes", task->id(), task->verified());
    publish(*task, true);
    persist();
    push_queue(task->id());
    return {};
}

std::error_code Scheduler::cancel(std::string_view id) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(std::string(id));
        if (it == tasks_.end()) {
            return make_error_code(DownloadErrc::unknown_task);
        }
        task = it->second;
        if (!task->transition(TaskStatus::cancelled)) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        task->request_cancel();
        tasks_.erase(it);
        std::erase(queue_, task->id());
    }

    spdlog::info("Task {} cancelled", task->id());
    publish(*task, true);
    persist();
    {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        last_emit_.erase(task->id());
    }

    // Without a running attempt nobody else will clean up
    std::unique_lock<std::mutex> attempt(task->attempt_mutex(), std::try_to_lock);
    if (attempt.owns_lock()) {
        if (auto* provider = select_provider(*task)) {
            provider->discard(*task);
        }
    }
    return {};
}

std::error_code Scheduler::retry(std::string_view id) {
    auto task = find(id);
    if (!task) {
        return make_error_code(DownloadErrc::unknown_task);
    }
    if (task->status() != TaskStatus::failed) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    task->rearm();
    task->reset_counters();
    task->clear_resolution();
    if (!task->transition_from(TaskStatus::failed, TaskStatus::queued)) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    task->error({});

    spdlog::info("Task {} retrying", task->id());
    publish(*task, true);
    persist();
    push_queue(task->id());
    return {};
}

std::error_code Scheduler::reconfigure(std::string_view id, TransferOverrides overrides) {
    auto task = find(id);
    if (!task) {
        return make_error_code(DownloadErrc::unknown_task);
    }

    auto status = task->status();
    if (status == TaskStatus::queued) {
        // Not started yet; the attempt reads the overrides when it begins
        task->overrides(overrides);
        persist();
        return {};
    }
    if (is_active(status)) {
        if (!task->transition(TaskStatus::paused)) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        task->request_cancel();
        publish(*task, true);
    } else if (status != TaskStatus::paused && status != TaskStatus::failed) {
        return make_error_code(DownloadErrc::invalid_state);
    }

    task->overrides(overrides);
    task->rearm();
    if (task->transition_from(TaskStatus::failed, TaskStatus::queued)) {
        task->reset_counters();
        task->clear_resolution();
    } else if (!task->transition_from(TaskStatus::paused, TaskStatus::queued)) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    task->error({});

    spdlog::info("Task {} reconfigured (single stream {}, max workers {})", task->id(),
                 overrides.force_single_stream ? "on" : "off", overrides.max_workers);
    publish(*task, true);
    persist();
    push_queue(task->id());
    return {};
}

std::error_code Scheduler::remove(std::string_view id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(std::string(id));
        if (it == tasks_.end()) {
            return make_error_code(DownloadErrc::unknown_task);
        }
        auto status = it->second->status();
        if (status != TaskStatus::completed && status != TaskStatus::failed) {
            return make_error_code(DownloadErrc::invalid_state);
        }
        tasks_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        last_emit_.erase(std::string(id));
    }
    spdlog::info("Task {} removed", id);
    persist();
    return {};
}

std::vector<TaskSnapshot> Scheduler::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskSnapshot> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task->snapshot());
    }
    return out;
}

std::optional<TaskSnapshot> Scheduler::get(std::string_view id) const {
    auto task = find(id);
    if (!task) {
        return std::nullopt;
    }
    return task->snapshot();
}

bool Scheduler::wait_idle(std::chrono::milliseconds timeout) {
    constexpr std::chrono::milliseconds POLL{20};
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        bool busy = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, task] : tasks_) {
                if (is_active(task->status())) {
                    busy = true;
                    break;
                }
            }
        }
        if (!busy) {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            busy = std::any_of(workers_.begin(), workers_.end(),
                               [](const Worker& w) { return !w.done->load(std::memory_order_acquire); });
        }
        if (!busy) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(POLL);
    }
}

void Scheduler::shutdown() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    dispatcher_.request_stop();
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    std::vector<std::shared_ptr<Task>> interrupted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        for (const auto& [id, task] : tasks_) {
            if (is_active(task->status()) && task->transition(TaskStatus::paused)) {
                task->request_cancel();
                interrupted.push_back(task);
            }
        }
    }
    for (const auto& task : interrupted) {
        publish(*task, true);
    }

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    workers.clear();  // Joins

    persist();
    spdlog::info("Scheduler stopped, {} task(s) paused", interrupted.size());
}

//=============================================================================
// Dispatch
//=============================================================================

void Scheduler::push_queue(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(queue_.begin(), queue_.end(), id) != queue_.end()) {
            return;
        }
        queue_.push_back(id);
    }
    queue_cv_.notify_one();
}

void Scheduler::dispatch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::string id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                break;
            }
            id = std::move(queue_.front());
            queue_.pop_front();
            // Still winding down; run_task requeues it on exit
            if (running_.contains(id)) {
                continue;
            }
        }

        // Queued tasks hold no permit until here
        bool acquired = false;
        while (!stop.stop_requested()) {
            if (permits_.try_acquire_for(MONITOR_INTERVAL)) {
                acquired = true;
                break;
            }
        }
        if (!acquired) {
            break;
        }

        std::shared_ptr<Task> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tasks_.find(id);
            if (it != tasks_.end() && it->second->status() == TaskStatus::queued
                && running_.insert(id).second) {
                task = it->second;
            }
        }
        if (!task) {
            permits_.release();
            continue;
        }

        reap_workers();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{
            std::jthread([this, task, done] {
                run_task(task);
                done->store(true, std::memory_order_release);
            }),
            done,
        });
    }
}

void Scheduler::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.remove_if([](const Worker& w) { return w.done->load(std::memory_order_acquire); });
}

//=============================================================================
// Task thread
//=============================================================================

void Scheduler::run_task(const std::shared_ptr<Task>& task) {
    PermitGuard permit{permits_};
    Provider* provider = select_provider(*task);
    if (!provider) {
        // Only reachable through a stored record naming an unknown provider
        task->error("No provider for " + task->url().str());
        if (task->transition_from(TaskStatus::queued, TaskStatus::resolving)) {
            fail(*task, make_error_code(DownloadErrc::invalid_url));
        }
        release(*task);
        return;
    }

    {
        // Waits for a previous attempt of the same task to wind down
        std::lock_guard<std::mutex> attempt(task->attempt_mutex());
        auto token = task->cancel_token();
        if (!token->requested()) {
            run_attempt(*task, *provider, *token);
        }

        if (task->status() == TaskStatus::paused) {
            task->rewind_progress_to_verified();
            persist();
        }
    }

    if (task->status() == TaskStatus::cancelled) {
        provider->discard(*task);
    }
    release(*task);
}

void Scheduler::release(const Task& task) {
    bool requeue = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.erase(task.id());
        // Resumed while this thread was still finishing
        requeue = tasks_.contains(task.id()) && task.status() == TaskStatus::queued;
    }
    if (requeue) {
        push_queue(task.id());
    }
}

void Scheduler::run_attempt(Task& task, Provider& provider, const CancelToken& token) {
    task.begin_attempt();
    task.rewind_progress_to_verified();

    try {
        if (!task.resolved() || !provider.resumable()) {
            if (!task.transition_from(TaskStatus::queued, TaskStatus::resolving)) {
                return;
            }
            spdlog::info("Task {}: resolving via {}", task.id(), provider.name());
            publish(task, true);
            persist();

            auto ec = provider.resolve(task, token);
            if (token.requested()) {
                return;
            }
            if (ec) {
                fail(task, ec);
                return;
            }
            if (!task.transition_from(TaskStatus::resolving, TaskStatus::downloading)) {
                return;
            }
        } else if (!task.transition_from(TaskStatus::queued, TaskStatus::downloading)) {
            return;
        }

        spdlog::info("Task {}: downloading {} (attempt {})", task.id(), task.filename(), task.attempts());
        task.reset_speed_metrics(Task::clock::now());
        publish(task, true);
        persist();

        auto ec = provider.download(task, token, hooks_for());
        if (token.requested()) {
            return;
        }
        if (ec) {
            fail(task, ec);
            return;
        }
        finalize(task, provider);
    } catch (const std::exception& e) {
        task.error(std::string("Internal error: ") + e.what());
        fail(task, make_error_code(DownloadErrc::network_error));
    }
}

void Scheduler::finalize(Task& task, Provider& provider) {
    const auto verified = task.verified();
    const auto total = task.total_size();
    if (verified != total) {
        task.error(std::format("Corruption: verified {} of {} bytes", verified, total));
        provider.discard(task);
        fail(task, make_error_code(DownloadErrc::corruption));
        return;
    }

    const auto temp = task.temp_path();
    const auto final_path = task.final_path();
    const bool rename = !temp.empty() && temp != final_path;
    if (rename) {
        if (auto ec = disk::rename_over(temp, final_path)) {
            task.error("Cannot move " + temp + " to " + final_path + ": " + ec.message());
            fail(task, ec);
            return;
        }
    }

    if (!task.transition_from(TaskStatus::downloading, TaskStatus::completed)) {
        // Paused or cancelled while finishing; keep the artifact resumable
        if (rename) {
            if (auto ec = disk::rename_over(final_path, temp)) {
                spdlog::warn("Task {}: cannot restore {}: {}", task.id(), temp, ec.message());
            }
        }
        return;
    }

    spdlog::info("Task {} completed: {} ({} bytes)", task.id(), final_path, total);
    publish(task, true);
    persist();
}

void Scheduler::fail(Task& task, std::error_code ec) {
    if (!task.transition(TaskStatus::failed)) {
        // Paused or cancelled meanwhile; that is not a failure
        task.error({});
        return;
    }
    if (task.error().empty()) {
        task.error(ec.message());
    }
    spdlog::error("Task {} failed: {}", task.id(), task.error());
    publish(task, true);
    persist();
}

//=============================================================================
// Helpers
//=============================================================================

std::shared_ptr<Task> Scheduler::find(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(std::string(id));
    return it == tasks_.end() ? nullptr : it->second;
}

Provider* Scheduler::select_provider(const Task& task) const {
    const auto& hint = task.provider_hint();
    for (const auto& provider : providers_) {
        if (!hint.empty()) {
            if (provider->name() == hint) {
                return provider.get();
            }
            continue;
        }
        if (provider->can_handle(task.url())) {
            return provider.get();
        }
    }
    return nullptr;
}

void Scheduler::publish(Task& task, bool force) {
    // Held across the emit so a sink never sees a task's events out of order
    std::lock_guard<std::mutex> lock(emit_mutex_);
    auto now = Task::clock::now();
    auto& last = last_emit_[task.id()];
    if (!force && last != Task::clock::time_point{} && now - last < config_.emit_interval) {
        return;
    }
    last = now;

    task.sample_speed(now);
    if (sink_) {
        sink_->emit(task.snapshot());
    }
}

void Scheduler::persist() {
    if (!store_) {
        return;
    }

    std::lock_guard<std::mutex> persist_lock(persist_mutex_);
    std::vector<TaskRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(tasks_.size());
        for (const auto& [id, task] : tasks_) {
            records.push_back(task->record());
        }
    }
    if (auto ec = store_->save(records)) {
        spdlog::warn("Cannot save state to {}: {}", store_->path(), ec.message());
    }
}

TransferHooks Scheduler::hooks_for() {
    TransferHooks hooks;
    hooks.progress = [this](Task& task) { publish(task, false); };
    hooks.checkpoint = [this](Task&) { persist(); };
    return hooks;
}

} // namespace surge::core
