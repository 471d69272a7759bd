// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace surge::core {

EngineConfig::EngineConfig()
    : download_dir(default_download_dir()) {}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream text;
        text << file.rdbuf();
        return parse(text.str());
    } catch (const std::exception& e) {
        spdlog::warn("Cannot read config {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::expected<EngineConfig, std::error_code>
EngineConfig::parse(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        EngineConfig cfg;
        cfg.max_active = j.value("max_active", cfg.max_active);
        cfg.download_dir = j.value("download_dir", cfg.download_dir);
        cfg.state_file = j.value("state_file", cfg.state_file);
        cfg.emit_interval = std::chrono::milliseconds{
            j.value("emit_interval_ms", static_cast<std::int64_t>(cfg.emit_interval.count()))};
        cfg.retry_backoff = std::chrono::milliseconds{
            j.value("retry_backoff_ms", static_cast<std::int64_t>(cfg.retry_backoff.count()))};
        cfg.chunk_attempts = j.value("chunk_attempts", cfg.chunk_attempts);
        cfg.stream_attempts = j.value("stream_attempts", cfg.stream_attempts);
        cfg.media_hosts = j.value("media_hosts", cfg.media_hosts);
        cfg.media_tool = j.value("media_tool", cfg.media_tool);
        cfg.log_level = j.value("log_level", cfg.log_level);
        cfg.user_agent = j.value("user_agent", cfg.user_agent);
        cfg.connect_timeout_sec = j.value("connect_timeout_sec", cfg.connect_timeout_sec);
        cfg.stall_timeout_sec = j.value("stall_timeout_sec", cfg.stall_timeout_sec);

        if (cfg.max_active == 0 || cfg.chunk_attempts == 0 || cfg.stream_attempts == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Invalid config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    } catch (const std::exception& e) {
        spdlog::warn("Invalid config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::string default_download_dir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::filesystem::current_path().string();
    }
    return (std::filesystem::path(home) / "Downloads").string();
}

} // namespace surge::core
