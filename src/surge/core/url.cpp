// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace surge::core {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3;

        auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
        auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
        auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());

        // host ends at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip user:pass@
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
                url.port_ = std::string(authority.substr(bracket_end + 2));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = to_lower(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = to_lower(authority);
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (path_start == host_end && path_start < url_str.length()) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        url.str_ = std::string(url_str);
        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    return percent_decode(name);
}

bool Url::host_matches(std::string_view domain) const noexcept {
    if (domain.empty() || host_.size() < domain.size()) {
        return false;
    }
    std::string_view host = host_;
    if (!host.ends_with(domain)) {
        return false;
    }
    return host.size() == domain.size() || host[host.size() - domain.size() - 1] == '.';
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace surge::core
