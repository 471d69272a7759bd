// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/ranged_http_provider.hpp>
#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace surge::core {

namespace {

// Shared by the chunk workers of one attempt
struct ChunkGroup {
    CancelToken stop;  // Aborts every chunk worker
    std::atomic<bool> range_refused{false};
    std::atomic<std::uint32_t> running{0};

    std::mutex failure_mutex;
    std::error_code failure;
    std::string failure_message;

    void fail(std::error_code ec, std::string message) {
        {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure) {
                failure = ec;
                failure_message = std::move(message);
            }
        }
        stop.request();
    }
};

bool is_disk_error(const std::error_code& ec) noexcept {
    return ec.category() == disk::disk_errc_category();
}

// Fetch one chunk with retries. A retry continues after the bytes already
// written; the chunk counts as verified only at exactly its expected length.
void fetch_chunk(HttpTransport& transport,
                 const RetryPolicy& policy,
                 const HttpRequest& base,
                 Task& task,
                 const ChunkRange& chunk,
                 const CancelToken& token,
                 ChunkGroup& group,
                 const TransferHooks& hooks,
                 disk::FileWriter& writer) {
    std::uint64_t written = 0;
    std::error_code last_error;

    for (std::uint32_t attempt = 0; attempt < policy.chunk_attempts; ++attempt) {
        if (group.stop.requested() || token.requested()) {
            return;
        }
        if (attempt > 0) {
            spdlog::warn("Task {}: chunk {} attempt {}/{} failed: {}",
                         task.id(), chunk.index, attempt, policy.chunk_attempts, last_error.message());
            task.note_stall();
            if (!sleep_unless_cancelled(group.stop, policy.backoff_unit * attempt)) {
                return;
            }
        }

        HttpRequest request = base;
        request.range = ByteRange{chunk.first + written, chunk.last};

        auto on_response = [&](const HttpResponse& response) -> std::error_code {
            task.last_http_status(response.status_code);
            if (response.status_code == 200) {
                group.range_refused.store(true, std::memory_order_release);
                group.stop.request();
                return make_error_code(DownloadErrc::range_not_honored);
            }
            if (response.status_code != 206) {
                return make_error_code(DownloadErrc::http_error);
            }
            if (response.range_start && *response.range_start != request.range->first) {
                return make_error_code(DownloadErrc::range_mismatch);
            }
            return {};
        };

        auto on_body = [&](const char* data, std::size_t size) -> std::error_code {
            if (group.stop.requested() || token.requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }
            std::uint64_t remaining = chunk.size() - written;
            std::uint64_t n = std::min<std::uint64_t>(size, remaining);
            if (n > 0) {
                if (auto ec = writer.write(chunk.first + written, data, static_cast<std::size_t>(n))) {
                    return ec;
                }
                written += n;
                task.mark_progress(n);
            }
            // Server sent past the end of the range
            if (size > remaining) {
                return make_error_code(DownloadErrc::invalid_range);
            }
            return {};
        };

        auto result = transport.get(request, group.stop, on_response, on_body);

        if (written == chunk.size()) {
            if (auto ec = task.mark_chunk_verified(chunk.index, chunk.size())) {
                group.fail(ec, std::format("Chunk {} rejected: {}", chunk.index, ec.message()));
                return;
            }
            spdlog::debug("Task {}: chunk {} verified ({} bytes)", task.id(), chunk.index, chunk.size());
            if (hooks.checkpoint) {
                hooks.checkpoint(task);
            }
            return;
        }

        if (group.stop.requested() || token.requested()) {
            return;
        }

        // A clean end before the last byte is a short chunk
        last_error = result ? make_error_code(DownloadErrc::incomplete_transfer) : result.error();
        if (is_disk_error(last_error)) {
            group.fail(last_error, std::format("Chunk {} write failed: {}", chunk.index, last_error.message()));
            return;
        }
    }

    group.fail(make_error_code(DownloadErrc::retries_exhausted),
               std::format("Chunk {} failed after {} attempts: {}",
                           chunk.index, policy.chunk_attempts, last_error.message()));
}

} // namespace

//=============================================================================
// Filename and path helpers
//=============================================================================

std::string sanitize_filename(std::string_view name) {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    while (!name.empty() && (name.front() == ' ' || name.front() == '\t')) name.remove_prefix(1);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) name.remove_suffix(1);
    if (name == "." || name == "..") {
        return {};
    }
    return std::string(name);
}

std::string derive_filename(const HttpResponse& response, std::string_view resolved_url) {
    auto name = sanitize_filename(response.filename);
    if (name.empty()) {
        auto url = Url::parse(resolved_url);
        if (url) {
            name = sanitize_filename(url->filename());
        }
    }
    if (name.empty()) {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        name = std::format("file_{}", std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }
    return name;
}

void assign_artifact_paths(Task& task) {
    auto filename = task.filename();
    if (filename.empty()) {
        return;
    }
    auto final_path = (std::filesystem::path(task.destination()) / filename).string();
    task.temp_path(final_path + ".part");
    task.final_path(std::move(final_path));
}

//=============================================================================
// RangedHttpProvider
//=============================================================================

RangedHttpProvider::RangedHttpProvider(std::shared_ptr<HttpTransport> transport, RetryPolicy policy)
    : transport_(std::move(transport))
    , policy_(policy) {}

HttpRequest RangedHttpProvider::request_for(const Task& task) const {
    HttpRequest request;
    request.url = task.resolved_url();
    if (request.url.empty()) {
        request.url = task.url().str();
    }
    request.headers = task.headers();
    return request;
}

std::error_code RangedHttpProvider::resolve(Task& task, const CancelToken& token) noexcept {
    try {
        HttpRequest request;
        request.url = task.url().str();
        request.headers = task.headers();

        HttpResponse response;
        bool ranges = false;

        auto head = transport_->head(request, token);
        if (head) {
            response = std::move(*head);
            ranges = response.accepts_ranges;
        } else {
            if (token.requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }
            // Some origins reject HEAD; a GET cut after the headers still
            // gives size and name, but range support is not assumed
            spdlog::warn("Task {}: HEAD failed ({}), trying GET", task.id(), head.error().message());
            request.headers_only = true;
            auto fallback = transport_->get(request, token, {}, {});
            if (!fallback) {
                if (token.requested()) {
                    return make_error_code(DownloadErrc::cancelled);
                }
                task.error("Resolution failed: " + fallback.error().message());
                return make_error_code(DownloadErrc::resolution_failed);
            }
            response = std::move(*fallback);
        }

        task.last_http_status(response.status_code);
        auto resolved = response.effective_url.empty() ? task.url().str() : response.effective_url;
        task.resolved_url(resolved);
        task.total_size(response.content_length);
        task.accepts_ranges(ranges && response.content_length > 0);
        if (!task.filename_resolved()) {
            task.filename(derive_filename(response, resolved));
        }
        assign_artifact_paths(task);

        spdlog::info("Task {}: resolved {} as {} ({} bytes, ranges {})",
                     task.id(), resolved, task.filename(), response.content_length,
                     task.accepts_ranges() ? "yes" : "no");
        return {};
    } catch (const std::exception& e) {
        task.error(std::string("Resolution failed: ") + e.what());
        return make_error_code(DownloadErrc::resolution_failed);
    }
}

std::error_code RangedHttpProvider::download(Task& task,
                                             const CancelToken& token,
                                             const TransferHooks& hooks) noexcept {
    try {
        assign_artifact_paths(task);
        auto temp = task.temp_path();
        if (temp.empty()) {
            task.error("Download failed: no filename resolved");
            return make_error_code(DownloadErrc::resolution_failed);
        }

        std::error_code dir_ec;
        std::filesystem::create_directories(task.destination(), dir_ec);
        if (dir_ec) {
            task.error("Cannot create " + task.destination() + ": " + dir_ec.message());
            return dir_ec;
        }

        auto total = task.total_size();
        auto verified = task.verified();

        auto workers = worker_count_for(total, task.accepts_ranges());
        const auto overrides = task.overrides();
        if (overrides.force_single_stream) {
            workers = 1;
        } else if (overrides.max_workers > 0) {
            workers = std::min(workers, overrides.max_workers);
        }

        // Chunked progress is only reusable under the plan it was made with
        if (verified > 0 && task.mode() == TransferMode::chunked) {
            const auto planned = task.chunk_workers();
            if (workers <= 1 || (planned != 0 && planned != workers)) {
                spdlog::warn("Task {}: chunk plan changed ({} -> {} workers), restarting",
                             task.id(), planned, workers);
                task.reset_counters();
                verified = 0;
            }
        }

        // Partial data vanished since the last attempt
        if (verified > 0) {
            auto needed = task.mode() == TransferMode::chunked ? total : verified;
            if (disk::file_size_or_zero(temp) < needed) {
                spdlog::warn("Task {}: partial file {} is missing or short, restarting", task.id(), temp);
                task.reset_counters();
                verified = 0;
            }
        }

        disk::FileWriter writer;
        if (auto ec = writer.open(temp, verified == 0)) {
            task.error("Cannot open " + temp + ": " + ec.message());
            return ec;
        }

        std::error_code ec;
        if (task.mode() == TransferMode::chunked && workers > 1) {
            ec = download_chunked(task, token, hooks, writer, workers);
        } else {
            task.mode(TransferMode::single_stream);
            ec = download_single(task, token, hooks, writer);
        }

        if (!ec) {
            ec = writer.flush();
            if (ec) {
                task.error("Cannot flush " + temp + ": " + ec.message());
            }
        }
        writer.close();
        return ec;
    } catch (const std::exception& e) {
        task.error(std::string("Download failed: ") + e.what());
        return make_error_code(DownloadErrc::network_error);
    }
}

std::error_code RangedHttpProvider::download_chunked(Task& task,
                                                     const CancelToken& token,
                                                     const TransferHooks& hooks,
                                                     disk::FileWriter& writer,
                                                     std::uint32_t workers) {
    const auto total = task.total_size();
    const auto plan = plan_chunks(total, workers);
    const auto done = task.completed_chunks();
    task.chunk_workers(workers);

    if (done.empty()) {
        if (auto ec = writer.truncate(total)) {
            task.error("Cannot allocate " + writer.path() + ": " + ec.message());
            return ec;
        }
    }

    spdlog::debug("Task {}: {} chunks over {} bytes, {} already verified",
                  task.id(), plan.size(), total, done.size());

    const auto base = request_for(task);
    ChunkGroup group;
    {
        std::vector<std::jthread> threads;
        threads.reserve(plan.size());
        for (const auto& chunk : plan) {
            if (done.contains(chunk.index)) {
                continue;
            }
            group.running.fetch_add(1, std::memory_order_acq_rel);
            threads.emplace_back([&, chunk] {
                fetch_chunk(*transport_, policy_, base, task, chunk, token, group, hooks, writer);
                group.running.fetch_sub(1, std::memory_order_acq_rel);
            });
        }

        // Monitor loop: forward cancellation and report progress
        while (group.running.load(std::memory_order_acquire) > 0) {
            if (token.requested()) {
                group.stop.request();
            }
            if (hooks.progress) {
                hooks.progress(task);
            }
            std::this_thread::sleep_for(MONITOR_INTERVAL);
        }
    }

    if (token.requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    if (group.range_refused.load(std::memory_order_acquire)) {
        spdlog::warn("Task {}: server ignored Range, switching to a single stream", task.id());
        task.reset_counters();
        if (auto ec = writer.truncate(0)) {
            task.error("Cannot truncate " + writer.path() + ": " + ec.message());
            return ec;
        }
        task.mode(TransferMode::single_stream);
        if (hooks.checkpoint) {
            hooks.checkpoint(task);
        }
        return download_single(task, token, hooks, writer);
    }

    if (group.failure) {
        task.error(group.failure_message);
        return group.failure;
    }
    return {};
}

std::error_code RangedHttpProvider::download_single(Task& task,
                                                    const CancelToken& token,
                                                    const TransferHooks& hooks,
                                                    disk::FileWriter& writer) {
    std::error_code last_error;

    for (std::uint32_t attempt = 0; attempt < policy_.stream_attempts; ++attempt) {
        if (token.requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }
        if (attempt > 0) {
            spdlog::warn("Task {}: stream attempt {}/{} failed: {}",
                         task.id(), attempt, policy_.stream_attempts, last_error.message());
            task.note_stall();
            if (!sleep_unless_cancelled(token, policy_.backoff_unit * attempt)) {
                return make_error_code(DownloadErrc::cancelled);
            }
        }

        const auto offset = task.verified();
        if (task.total_size() > 0 && offset == task.total_size()) {
            return {};
        }

        auto request = request_for(task);
        if (offset > 0) {
            request.range = ByteRange{offset, std::nullopt};
            spdlog::info("Task {}: resuming at byte {}", task.id(), offset);
        }

        std::uint64_t position = offset;

        auto on_response = [&](const HttpResponse& response) -> std::error_code {
            task.last_http_status(response.status_code);
            if (offset > 0 && response.status_code == 200) {
                spdlog::warn("Task {}: server ignored Range on resume, restarting from zero", task.id());
                task.reset_counters();
                position = 0;
                if (auto ec = writer.truncate(0)) {
                    return ec;
                }
            } else if (response.status_code != 200 && response.status_code != 206) {
                return make_error_code(DownloadErrc::http_error);
            } else if (response.status_code == 206 && response.range_start && *response.range_start != offset) {
                spdlog::warn("Task {}: asked for byte {}, got a range at {}",
                             task.id(), offset, *response.range_start);
                return make_error_code(DownloadErrc::range_mismatch);
            }
            if (position == 0 && task.total_size() == 0 && response.content_length > 0) {
                task.total_size(response.content_length);
            }
            return {};
        };

        auto on_body = [&](const char* data, std::size_t size) -> std::error_code {
            if (token.requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }
            if (auto ec = writer.write(position, data, size)) {
                return ec;
            }
            position += size;
            task.mark_progress(size);
            if (auto ec = task.mark_verified(size)) {
                return ec;
            }
            if (hooks.progress) {
                hooks.progress(task);
            }
            return {};
        };

        auto result = transport_->get(request, token, on_response, on_body);
        if (hooks.checkpoint) {
            hooks.checkpoint(task);
        }

        if (token.requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }

        if (result) {
            auto verified = task.verified();
            auto total = task.total_size();
            if (total == 0) {
                // Size was unknown; the clean end of the stream defines it
                task.total_size(verified);
                return {};
            }
            if (verified >= total) {
                return {};
            }
            last_error = make_error_code(DownloadErrc::incomplete_transfer);
            continue;
        }

        last_error = result.error();
        if (is_disk_error(last_error) || last_error == DownloadErrc::invalid_range) {
            task.error("Download failed: " + last_error.message());
            return last_error;
        }
    }

    task.error(std::format("Download failed after {} attempts: {}",
                           policy_.stream_attempts, last_error.message()));
    return make_error_code(DownloadErrc::retries_exhausted);
}

void RangedHttpProvider::discard(Task& task) noexcept {
    try {
        if (task.temp_path().empty()) {
            assign_artifact_paths(task);
        }
        auto temp = task.temp_path();
        if (temp.empty()) {
            return;
        }
        if (auto ec = disk::remove_if_exists(temp)) {
            spdlog::warn("Task {}: cannot delete {}: {}", task.id(), temp, ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Task {}: cannot discard partial output: {}", task.id(), e.what());
    }
}

} // namespace surge::core
