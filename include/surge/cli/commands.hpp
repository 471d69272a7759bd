// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace surge::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_file;
    std::string state_file;
    std::uint32_t jobs{0};  // 0: from config
    std::uint32_t connections{0};  // Chunk worker cap; 0: size based
    bool single{false};  // One connection per transfer
    bool info{false};
    bool json{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // Set when an option is malformed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config file (if any) with command line overrides applied
[[nodiscard]] std::expected<core::EngineConfig, std::error_code>
build_config(const CliArgs& args) noexcept;

// Route spdlog to stderr at the level the arguments ask for
void configure_logging(const CliArgs& args, const core::EngineConfig& config) noexcept;

// Download every URL through one scheduler; 0 when all completed
[[nodiscard]] CliResult download(const CliArgs& args, const core::EngineConfig& config) noexcept;

// Resolve a URL and print its metadata without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::EngineConfig& config) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace surge::cli
