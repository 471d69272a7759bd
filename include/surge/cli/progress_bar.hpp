// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace surge::cli {

// Single-line progress bar redrawn in place
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw when the whole percent changed; unknown totals show bytes only
    void update(std::uint64_t current, std::uint64_t total, double speed_bps = 0.0) noexcept;

    // Draw the final state and end the line
    void finish(std::string_view status) noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // Text of the line without the carriage return
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t total, double speed_bps) const;

    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::string label_;
    int last_percent_{-1};
    std::uint64_t last_bytes_{0};
    std::size_t last_width_{0};
    bool finished_{false};
};

} // namespace surge::cli
