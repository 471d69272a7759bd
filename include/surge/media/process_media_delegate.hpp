// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/media/media_delegate.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace surge::media {

// Runs an external extractor (yt-dlp compatible command line) as a child
// process and follows its output line by line.
class ProcessMediaDelegate final : public MediaDelegate {
public:
    explicit ProcessMediaDelegate(std::string tool = "yt-dlp");

    [[nodiscard]] std::expected<std::string, MediaError>
    fetch(const MediaRequest& request,
          const core::CancelToken& token,
          const MediaCallbacks& callbacks) noexcept override;

    // argv for a request, tool name first
    [[nodiscard]] std::vector<std::string> arguments(const MediaRequest& request) const;

    [[nodiscard]] const std::string& tool() const noexcept { return tool_; }

private:
    std::string tool_;
};

// One line of tool output, classified
struct ToolLine {
    enum class Kind : std::uint8_t {
        progress,     // Machine-readable progress template
        destination,  // Tool announced the file it writes
        result,       // Final path after post-processing
        error,        // "ERROR: ..." diagnostic
        other
    };

    Kind kind{Kind::other};
    MediaProgress progress;
    std::string text;  // Path for destination/result, message for error
};

[[nodiscard]] ToolLine parse_tool_line(std::string_view line);

} // namespace surge::media
