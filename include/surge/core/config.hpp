// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace surge::core {

constexpr std::uint64_t MiB = 1024 * 1024;

// Worker tiers for ranged transfers
constexpr std::uint64_t LARGE_FILE_THRESHOLD = 100 * MiB;
constexpr std::uint64_t MEDIUM_FILE_THRESHOLD = 50 * MiB;
constexpr std::uint64_t SMALL_FILE_THRESHOLD = 10 * MiB;
constexpr std::uint32_t LARGE_FILE_WORKERS = 24;
constexpr std::uint32_t MEDIUM_FILE_WORKERS = 16;
constexpr std::uint32_t SMALL_FILE_WORKERS = 8;

constexpr std::uint32_t DEFAULT_MAX_ACTIVE = 3;
constexpr std::uint32_t RETRY_COUNT = 3;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 15;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;    // 256 KB

constexpr std::chrono::milliseconds EMIT_INTERVAL{400};
constexpr std::chrono::milliseconds MONITOR_INTERVAL{100};
constexpr std::chrono::milliseconds RETRY_BACKOFF_UNIT{1000};

// Engine-wide settings, loadable from a JSON file
struct EngineConfig {
    std::uint32_t max_active{DEFAULT_MAX_ACTIVE};
    std::string download_dir;             // Default destination for requests without one
    std::string state_file;               // Empty disables persistence
    std::chrono::milliseconds emit_interval{EMIT_INTERVAL};
    std::chrono::milliseconds retry_backoff{RETRY_BACKOFF_UNIT};
    std::uint32_t chunk_attempts{RETRY_COUNT};
    std::uint32_t stream_attempts{RETRY_COUNT};
    std::vector<std::string> media_hosts{"youtube.com", "youtu.be"};
    std::string media_tool{"yt-dlp"};
    std::string log_level{"info"};
    std::string user_agent;
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};

    EngineConfig();

    // Read a JSON object; keys not present keep their defaults
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    parse(std::string_view json_text) noexcept;
};

// $HOME/Downloads, or the working directory when HOME is unset
[[nodiscard]] std::string default_download_dir();

} // namespace surge::core
