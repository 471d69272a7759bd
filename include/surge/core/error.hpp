// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>

namespace surge::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    connection_lost,
    not_found,
    server_error,
    http_error,
    permission_denied,
    too_many_redirects,
    ssl_error,
    dns_error,
    invalid_url,
    invalid_range,
    range_not_honored,
    incomplete_transfer,
    retries_exhausted,
    resolution_failed,
    corruption,
    cancelled,
    delegate_failed,
    delegate_unavailable,
    unknown_task,
    invalid_state,
    invalid_config,
    invalid_filename,
    range_mismatch,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::connection_lost:      return "Connection lost";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::http_error:           return "Unexpected HTTP status";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::range_not_honored:    return "Server ignored the Range header";
            case DownloadErrc::incomplete_transfer:  return "Transfer ended early";
            case DownloadErrc::retries_exhausted:    return "Retries exhausted";
            case DownloadErrc::resolution_failed:    return "Resolution failed";
            case DownloadErrc::corruption:           return "Verified size does not match total size";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::delegate_failed:      return "Media extraction failed";
            case DownloadErrc::delegate_unavailable: return "Media extraction tool unavailable";
            case DownloadErrc::unknown_task:         return "Unknown task id";
            case DownloadErrc::invalid_state:        return "Operation not allowed in the current state";
            case DownloadErrc::invalid_config:       return "Invalid configuration";
            case DownloadErrc::invalid_filename:     return "Invalid filename";
            case DownloadErrc::range_mismatch:       return "Content-Range does not match the request";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Errors worth another attempt of the same request
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != download_errc_category()) {
        return false;
    }
    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::connection_lost:
        case DownloadErrc::server_error:
        case DownloadErrc::http_error:
        case DownloadErrc::incomplete_transfer:
        case DownloadErrc::range_mismatch:
        case DownloadErrc::ssl_error:
        case DownloadErrc::dns_error:
            return true;
        default:
            return false;
    }
}

} // namespace surge::core

namespace std {

template<>
struct is_error_code_enum<surge::core::DownloadErrc> : true_type {};

} // namespace std
