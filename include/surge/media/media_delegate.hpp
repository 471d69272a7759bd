// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/task.hpp>
#include <surge/core/url.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <system_error>

namespace surge::media {

struct MediaRequest {
    std::string url;
    std::string output_dir;
    std::string filename;   // Empty: the tool picks one from the title
    std::string format_id;  // Empty: the tool's default selection
    core::Headers headers;
};

// Progress of the stream currently being fetched. Tools that fetch audio
// and video separately start again from zero for each stream.
struct MediaProgress {
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};
};

struct MediaCallbacks {
    std::function<void(const MediaProgress&)> progress;
    std::function<void(const std::string& path)> destination;  // File the tool is writing
};

struct MediaError {
    std::error_code code;
    std::string message;  // Diagnostic from the tool
};

// Something that can turn a media page URL into a local file
class MediaDelegate {
public:
    virtual ~MediaDelegate() = default;

    // Blocks until the file is produced, the tool fails or the token is
    // requested. Returns the path of the produced file.
    [[nodiscard]] virtual std::expected<std::string, MediaError>
    fetch(const MediaRequest& request,
          const core::CancelToken& token,
          const MediaCallbacks& callbacks) noexcept = 0;
};

} // namespace surge::media
