// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/error.hpp>
#include <surge/core/task.hpp>
#include <surge/core/url.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace surge::core {

// Byte range for a Range request; an empty `last` means open-ended
struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last;

    // "a-b" or "a-", the form libcurl's CURLOPT_RANGE takes
    [[nodiscard]] std::string to_string() const;
    // "bytes=a-b"
    [[nodiscard]] std::string header_value() const { return "bytes=" + to_string(); }
};

struct HttpRequest {
    std::string url;
    Headers headers;
    std::optional<ByteRange> range;
    bool headers_only{false};  // GET that stops once the response headers are in
};

// Final response of a request, after redirects
struct HttpResponse {
    std::int32_t status_code{0};
    Headers headers;               // Names lowercased
    std::string effective_url;
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename;          // From Content-Disposition
    std::optional<std::uint64_t> range_start;  // First byte of a 206 Content-Range
};

// Called once with the final status and headers, before any body byte.
// A returned error aborts the transfer and becomes its result.
using ResponseHandler = std::function<std::error_code(const HttpResponse&)>;

// Called for every received body buffer. A returned error aborts.
using BodyHandler = std::function<std::error_code(const char* data, std::size_t size)>;

// Blocking HTTP client used by the ranged provider.
// Statuses >= 400 come back as errors (see status_error).
// A requested token aborts with DownloadErrc::cancelled.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request, const CancelToken& token) noexcept = 0;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const CancelToken& token,
        const ResponseHandler& on_response,
        const BodyHandler& on_body) noexcept = 0;
};

struct HttpOptions {
    std::string user_agent;
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
};

// libcurl implementation; one easy handle per request
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;
    explicit HttpSession(HttpOptions options);

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request, const CancelToken& token) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const CancelToken& token,
        const ResponseHandler& on_response,
        const BodyHandler& on_body) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

// Map an HTTP status to an error; empty for statuses below 400
[[nodiscard]] std::error_code status_error(std::int32_t status) noexcept;

// Fill the derived fields of a response from its header map
void finish_response(HttpResponse& response);

// First byte position of "bytes a-b/total"; nullopt when malformed
[[nodiscard]] std::optional<std::uint64_t> parse_content_range(std::string_view content_range);

// Filename from a Content-Disposition value. filename*= (RFC 5987) wins
// over filename=. Empty when neither is present.
[[nodiscard]] std::string parse_content_disposition(std::string_view content_disposition);

} // namespace surge::core
