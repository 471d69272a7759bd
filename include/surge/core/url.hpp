// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <expected>

namespace surge::core {

// Request header name → value, sent verbatim
using Headers = std::map<std::string, std::string>;

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    // The string the URL was parsed from
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] std::string base() const;  // scheme://host[:port]

    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, percent-decoded; empty for directory paths
    [[nodiscard]] std::string filename() const;

    // True when host equals domain or is a subdomain of it
    [[nodiscard]] bool host_matches(std::string_view domain) const noexcept;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Decode %XX escapes; '+' is left alone since paths do not use form encoding
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace surge::core
