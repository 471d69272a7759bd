// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/progress_bar.hpp>
#include <surge/core/config.hpp>
#include <surge/core/task.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace surge::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total, double speed_bps) noexcept {
    if (finished_) return;

    // Only redraw on a new whole percent, or every MiB when the total is unknown
    if (total > 0) {
        int percent = static_cast<int>(std::clamp(
            static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0));
        if (percent == last_percent_) return;
        last_percent_ = percent;
    } else {
        if (current < last_bytes_ + core::MiB && last_bytes_ != 0) return;
        last_bytes_ = current == 0 ? 1 : current;
    }

    try {
        std::string line = render(current, total, speed_bps);
        std::string padding(last_width_ > line.size() ? last_width_ - line.size() : 0, ' ');
        last_width_ = line.size();
        std::cout << "\r" << line << padding << std::flush;
    } catch (const std::exception& e) {
        spdlog::debug("Progress redraw failed: {}", e.what());
        last_percent_ = -1;
    }
}

void ProgressBar::finish(std::string_view status) noexcept {
    if (finished_) return;
    finished_ = true;
    clear();
    std::cout << label_ << ": " << status << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(last_width_, ' ') << "\r" << std::flush;
    last_width_ = 0;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t total, double speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total > 0) {
        double percent = std::clamp(
            static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
        line += render_bar(percent);

        line += std::format(" {:3}%", static_cast<int>(percent));
    }

    line += " (";
    line += core::format_bytes(current);
    line += "/";
    line += core::format_total(total);
    line += ")";

    if (speed_bps > 0.0) {
        line += " @ ";
        line += core::format_speed(speed_bps);

        if (total > current) {
            auto eta = static_cast<std::uint64_t>(static_cast<double>(total - current) / speed_bps);
            line += " ETA: ";
            line += format_time(eta);
        }
    }
    return line;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    const int empty = BAR_WIDTH - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}h {:02}m {}s", hours, minutes, secs);
    } else if (minutes > 0) {
        return std::format("{}m {}s", minutes, secs);
    }
    return std::format("{}s", secs);
}

} // namespace surge::cli
