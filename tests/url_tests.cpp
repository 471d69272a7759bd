// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/url.hpp>

using namespace surge::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/file.zip");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/file.zip");
        CHECK(url.is_secure());
        CHECK(url.is_http());
        CHECK(url.str() == "https://example.com/file.zip");
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/path");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "http");
        CHECK(url.port() == "8080");
        CHECK(url.base() == "http://example.com:8080");
        CHECK(!url.is_secure());
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/file.zip?v=1#section");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.path() == "/file.zip");
        CHECK(url.query() == "v=1");
        CHECK(url.fragment() == "section");
    }

    SECTION("Host is lowercased, credentials skipped") {
        auto result = Url::parse("https://user:pw@CDN.Example.COM/a");
        REQUIRE(result.has_value());
        CHECK(result->host() == "cdn.example.com");
    }

    SECTION("Bare host gets root path") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        CHECK(!Url::parse("example.com/file.zip").has_value());
    }

    SECTION("Empty string") {
        CHECK(!Url::parse("").has_value());
    }

    SECTION("Empty host") {
        CHECK(!Url::parse("https:///file.zip").has_value());
    }

    SECTION("Non-numeric port") {
        auto result = Url::parse("http://example.com:abc/");
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::invalid_url);
    }

    SECTION("Other schemes parse but are not HTTP") {
        auto result = Url::parse("ftp://example.com/file");
        REQUIRE(result.has_value());
        CHECK(!result->is_http());
    }
}

TEST_CASE("Url::filename extraction", "[url]") {
    SECTION("Simple filename") {
        CHECK(Url::parse("https://example.com/myfile.zip")->filename() == "myfile.zip");
    }

    SECTION("URL with query params") {
        CHECK(Url::parse("https://example.com/download.php?id=123")->filename() == "download.php");
    }

    SECTION("Percent-encoded name") {
        CHECK(Url::parse("https://example.com/my%20file.zip")->filename() == "my file.zip");
    }

    SECTION("Path without filename") {
        CHECK(Url::parse("https://example.com/folder/")->filename().empty());
    }
}

TEST_CASE("Url::host_matches", "[url]") {
    auto url = Url::parse("https://www.youtube.com/watch?v=x");
    REQUIRE(url.has_value());
    CHECK(url->host_matches("youtube.com"));
    CHECK(url->host_matches("www.youtube.com"));
    CHECK(!url->host_matches("tube.com"));
    CHECK(!url->host_matches(""));
    CHECK(Url::parse("https://youtu.be/abc")->host_matches("youtu.be"));
}

TEST_CASE("percent_decode", "[url]") {
    CHECK(percent_decode("a%2Fb") == "a/b");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz") == "%zz");
    CHECK(percent_decode("a+b") == "a+b");
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
}
