// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/http_session.hpp>
#include <surge/core/config.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>

namespace surge::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII request header list
struct CurlHeaderList {
    curl_slist* ptr = nullptr;

    CurlHeaderList() = default;
    ~CurlHeaderList() { if (ptr) curl_slist_free_all(ptr); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& line) {
        auto* next = curl_slist_append(ptr, line.c_str());
        if (next) ptr = next;
    }
};

// State shared with the libcurl callbacks of one request
struct Exchange {
    CURL* curl{nullptr};
    const HttpRequest* request{nullptr};
    const CancelToken* token{nullptr};
    const ResponseHandler* on_response{nullptr};
    const BodyHandler* on_body{nullptr};

    HttpResponse response;
    bool delivered{false};
    bool stopped_after_headers{false};
    std::error_code handler_error;
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Header callback; a new status line starts a new header block (redirects)
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ex = static_cast<Exchange*>(userdata);
    if (!ex) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        ex->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    try {
        ex->response.headers[to_lower(trim(header.substr(0, colon)))] =
            std::string(trim(header.substr(colon + 1)));
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

// Collect the final status and hand the response to the caller once
bool deliver(Exchange& ex) {
    ex.delivered = true;

    long http_code = 0;
    curl_easy_getinfo(ex.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ex.response.status_code = static_cast<std::int32_t>(http_code);

    char* effective = nullptr;
    if (curl_easy_getinfo(ex.curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        ex.response.effective_url = effective;
    } else {
        ex.response.effective_url = ex.request->url;
    }

    finish_response(ex.response);

    if (auto ec = status_error(ex.response.status_code)) {
        ex.handler_error = ec;
        return false;
    }
    if (ex.on_response && *ex.on_response) {
        if (auto ec = (*ex.on_response)(ex.response)) {
            ex.handler_error = ec;
            return false;
        }
    }
    return true;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ex = static_cast<Exchange*>(userdata);
    std::size_t bytes = size * nmemb;

    try {
        if (!ex->delivered && !deliver(*ex)) {
            return 0;
        }
        if (ex->request->headers_only) {
            ex->stopped_after_headers = true;
            return 0;
        }
        if (ex->token->requested()) {
            ex->handler_error = make_error_code(DownloadErrc::cancelled);
            return 0;
        }
        if (ex->on_body && *ex->on_body) {
            if (auto ec = (*ex->on_body)(ptr, bytes)) {
                ex->handler_error = ec;
                return 0;
            }
        }
    } catch (const std::exception&) {
        ex->handler_error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    return bytes;
}

// libcurl progress callback - aborts once the token is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ex = static_cast<Exchange*>(userdata);
    return ex->token->requested() ? 1 : 0;
}

std::error_code curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OK:
            return {};
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

std::string ByteRange::to_string() const {
    return last ? std::format("{}-{}", first, *last) : std::format("{}-", first);
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const HttpRequest& request, const CancelToken& token) noexcept {
    // A HEAD is a body-less GET as far as the callbacks are concerned
    static const ResponseHandler no_response;
    static const BodyHandler no_body;
    HttpRequest plain = request;
    plain.range.reset();
    plain.headers_only = false;

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    Exchange ex;
    ex.curl = curl.ptr;
    ex.request = &plain;
    ex.token = &token;
    ex.on_response = &no_response;
    ex.on_body = &no_body;

    CurlHeaderList header_list;
    try {
        for (const auto& [name, value] : plain.headers) {
            header_list.append(name + ": " + value);
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, plain.url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    if (!options_.user_agent.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }
    if (header_list.ptr) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.ptr);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ex);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ex);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = curl_error(result)) {
        return std::unexpected(ec);
    }

    try {
        if (!deliver(ex)) {
            return std::unexpected(ex.handler_error);
        }
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
    return ex.response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const HttpRequest& request,
                 const CancelToken& token,
                 const ResponseHandler& on_response,
                 const BodyHandler& on_body) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    Exchange ex;
    ex.curl = curl.ptr;
    ex.request = &request;
    ex.token = &token;
    ex.on_response = &on_response;
    ex.on_body = &on_body;

    CurlHeaderList header_list;
    std::string range;
    try {
        for (const auto& [name, value] : request.headers) {
            header_list.append(name + ": " + value);
        }
        if (request.range) {
            range = request.range->to_string();
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
    if (!range.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
    if (!options_.user_agent.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }
    if (header_list.ptr) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.ptr);
    }

    // HTTP/2
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ex);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ex);

    // Progress callback to allow interruption
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ex);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (result == CURLE_WRITE_ERROR && ex.stopped_after_headers) {
        return ex.response;
    }
    if (ex.handler_error) {
        return std::unexpected(ex.handler_error);
    }
    if (auto ec = curl_error(result)) {
        return std::unexpected(ec);
    }

    // Empty bodies never reach the write callback
    try {
        if (!ex.delivered && !deliver(ex)) {
            return std::unexpected(ex.handler_error);
        }
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
    return ex.response;
}

//=============================================================================
// Response helpers
//=============================================================================

std::error_code status_error(std::int32_t status) noexcept {
    if (status < 400) {
        return {};
    }
    switch (status) {
        case 401:
        case 403: return make_error_code(DownloadErrc::permission_denied);
        case 404:
        case 410: return make_error_code(DownloadErrc::not_found);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        default:  break;
    }
    return status >= 500 ? make_error_code(DownloadErrc::server_error)
                         : make_error_code(DownloadErrc::http_error);
}

void finish_response(HttpResponse& response) {
    response.content_length = 0;
    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end() && !cl_it->second.empty()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
        if (end == cl_it->second.c_str() + cl_it->second.size()) {
            response.content_length = static_cast<std::uint64_t>(val);
        }
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }

    // Check if ranges are supported
    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
        && to_lower(ar_it->second).find("bytes") != std::string::npos;

    auto cr_it = response.headers.find("content-range");
    response.range_start = cr_it != response.headers.end()
        ? parse_content_range(cr_it->second)
        : std::nullopt;

    auto cd_it = response.headers.find("content-disposition");
    response.filename = cd_it != response.headers.end()
        ? parse_content_disposition(cd_it->second)
        : std::string{};
}

std::optional<std::uint64_t> parse_content_range(std::string_view content_range) {
    auto lower = to_lower(content_range);
    std::string_view text = lower;
    if (!text.starts_with("bytes")) {
        return std::nullopt;
    }
    text.remove_prefix(5);
    while (!text.empty() && (text.front() == ' ' || text.front() == '=')) text.remove_prefix(1);

    // "*/1000" carries no start
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    std::string digits(text);
    char* end = nullptr;
    unsigned long long first = std::strtoull(digits.c_str(), &end, 10);
    if (end == digits.c_str() || *end != '-') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(first);
}

std::string parse_content_disposition(std::string_view content_disposition) {
    auto lower = to_lower(content_disposition);

    // Parse "attachment; filename*=UTF-8''na%20me.zip"
    auto ext_pos = lower.find("filename*=");
    if (ext_pos != std::string::npos) {
        auto value = content_disposition.substr(ext_pos + 10);
        value = value.substr(0, value.find(';'));
        value = trim(value);
        auto quote = value.find("''");
        if (quote != std::string_view::npos) {
            value.remove_prefix(quote + 2);
        }
        if (!value.empty()) {
            return percent_decode(value);
        }
    }

    // Parse "attachment; filename=file.zip"
    auto pos = lower.find("filename=");
    if (pos == std::string::npos) {
        return {};
    }

    auto value = trim(content_disposition.substr(pos + 9));
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        char quote = value.front();
        value.remove_prefix(1);
        auto close = value.find(quote);
        return std::string(value.substr(0, close));
    }
    return std::string(trim(value.substr(0, value.find(';'))));
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace surge::core
