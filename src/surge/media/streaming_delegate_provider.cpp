// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/media/streaming_delegate_provider.hpp>
#include <surge/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace surge::media {

StreamingDelegateProvider::StreamingDelegateProvider(std::shared_ptr<MediaDelegate> delegate,
                                                     std::vector<std::string> hosts)
    : delegate_(std::move(delegate))
    , hosts_(std::move(hosts)) {}

bool StreamingDelegateProvider::can_handle(const core::Url& url) const noexcept {
    if (!url.is_http()) {
        return false;
    }
    for (const auto& host : hosts_) {
        if (url.host_matches(host)) {
            return true;
        }
    }
    return false;
}

std::error_code StreamingDelegateProvider::resolve(core::Task& task, const core::CancelToken& token) noexcept {
    if (token.requested()) {
        return make_error_code(core::DownloadErrc::cancelled);
    }
    // The tool resolves formats and names itself
    try {
        task.resolved_url(task.url().str());
    } catch (const std::exception& e) {
        task.error(std::string("Resolution failed: ") + e.what());
        return make_error_code(core::DownloadErrc::resolution_failed);
    }
    task.accepts_ranges(false);
    task.total_size(0);
    return {};
}

std::error_code StreamingDelegateProvider::download(core::Task& task,
                                                    const core::CancelToken& token,
                                                    const core::TransferHooks& hooks) noexcept {
    try {
        // No partial resume: start from a clean slate
        if (!task.temp_path().empty()) {
            discard(task);
        }
        task.reset_counters();
        task.total_size(0);
        task.mode(core::TransferMode::single_stream);

        std::error_code dir_ec;
        std::filesystem::create_directories(task.destination(), dir_ec);
        if (dir_ec) {
            task.error("Cannot create " + task.destination() + ": " + dir_ec.message());
            return dir_ec;
        }

        MediaRequest request;
        request.url = task.url().str();
        request.output_dir = task.destination();
        if (task.caller_filename()) {
            request.filename = task.filename();
        }
        request.format_id = task.format_id();
        request.headers = task.headers();

        // Bytes of streams already finished, for tools that fetch several
        std::uint64_t finished = 0;
        std::uint64_t finished_total = 0;
        std::uint64_t last = 0;
        std::uint64_t last_total = 0;

        MediaCallbacks callbacks;
        callbacks.progress = [&](const MediaProgress& p) {
            if (p.downloaded_bytes < last) {
                finished += last;
                finished_total += last_total;
            }
            std::uint64_t delta = p.downloaded_bytes >= last ? p.downloaded_bytes - last : p.downloaded_bytes;
            last = p.downloaded_bytes;
            last_total = p.total_bytes;
            task.mark_progress(delta);
            if (p.total_bytes > 0) {
                task.total_size(finished_total + p.total_bytes);
            }
            if (hooks.progress) {
                hooks.progress(task);
            }
        };
        callbacks.destination = [&](const std::string& path) {
            task.temp_path(path);
            if (!task.caller_filename()) {
                task.filename(std::filesystem::path(path).filename().string());
            }
            if (hooks.checkpoint) {
                hooks.checkpoint(task);
            }
        };

        auto result = delegate_->fetch(request, token, callbacks);
        if (!result) {
            if (token.requested()) {
                return make_error_code(core::DownloadErrc::cancelled);
            }
            const auto& err = result.error();
            task.error(err.message.empty() ? err.code.message() : err.message);
            return err.code;
        }

        const auto& path = *result;
        auto size = disk::file_size_or_zero(path);
        if (size == 0) {
            task.error("Media output missing: " + path);
            return make_error_code(core::DownloadErrc::delegate_failed);
        }

        task.reset_counters();
        task.total_size(size);
        task.mark_progress(size);
        if (auto ec = task.mark_verified(size)) {
            task.error("Media output rejected: " + ec.message());
            return ec;
        }
        task.final_path(path);
        task.temp_path(path);
        if (!task.caller_filename()) {
            task.filename(std::filesystem::path(path).filename().string());
        }
        spdlog::info("Task {}: media saved to {} ({} bytes)", task.id(), path, size);
        return {};
    } catch (const std::exception& e) {
        task.error(std::string("Media download failed: ") + e.what());
        return make_error_code(core::DownloadErrc::delegate_failed);
    }
}

void StreamingDelegateProvider::discard(core::Task& task) noexcept {
    try {
        auto temp = task.temp_path();
        if (temp.empty()) {
            return;
        }
        for (const auto& path : {temp, temp + ".part", temp + ".ytdl"}) {
            if (auto ec = disk::remove_if_exists(path)) {
                spdlog::warn("Task {}: cannot delete {}: {}", task.id(), path, ec.message());
            }
        }
        task.temp_path({});
    } catch (const std::exception& e) {
        spdlog::warn("Task {}: cannot discard partial output: {}", task.id(), e.what());
    }
}

} // namespace surge::media
