// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/ranged_http_provider.hpp>
#include <string>

using namespace surge::core;

TEST_CASE("parse_content_disposition", "[http]") {
    SECTION("Quoted filename") {
        CHECK(parse_content_disposition(R"(attachment; filename="report 2026.pdf")") == "report 2026.pdf");
    }

    SECTION("Unquoted filename") {
        CHECK(parse_content_disposition("attachment; filename=data.csv; size=10") == "data.csv");
    }

    SECTION("RFC 5987 form wins") {
        CHECK(parse_content_disposition(
                  R"(attachment; filename="fallback.zip"; filename*=UTF-8''na%C3%AFve%20file.zip)")
              == "na\xC3\xAFve file.zip");
    }

    SECTION("Header names are case-insensitive") {
        CHECK(parse_content_disposition("Attachment; FILENAME=Setup.EXE") == "Setup.EXE");
    }

    SECTION("No filename") {
        CHECK(parse_content_disposition("inline").empty());
        CHECK(parse_content_disposition("").empty());
    }
}

TEST_CASE("status_error", "[http]") {
    CHECK(!status_error(200));
    CHECK(!status_error(206));
    CHECK(!status_error(302));
    CHECK(status_error(401) == DownloadErrc::permission_denied);
    CHECK(status_error(403) == DownloadErrc::permission_denied);
    CHECK(status_error(404) == DownloadErrc::not_found);
    CHECK(status_error(410) == DownloadErrc::not_found);
    CHECK(status_error(416) == DownloadErrc::invalid_range);
    CHECK(status_error(429) == DownloadErrc::http_error);
    CHECK(status_error(503) == DownloadErrc::server_error);
}

TEST_CASE("finish_response derives fields from headers", "[http]") {
    HttpResponse response;
    response.headers = {
        {"content-length", "1048576"},
        {"accept-ranges", "Bytes"},
        {"content-type", "application/zip"},
        {"content-disposition", "attachment; filename=\"pack.zip\""},
    };
    finish_response(response);
    CHECK(response.content_length == 1048576);
    CHECK(response.accepts_ranges);
    CHECK(response.content_type == "application/zip");
    CHECK(response.filename == "pack.zip");

    SECTION("Missing or junk values") {
        HttpResponse bare;
        bare.headers = {{"content-length", "12abc"}, {"accept-ranges", "none"}};
        finish_response(bare);
        CHECK(bare.content_length == 0);
        CHECK(!bare.accepts_ranges);
        CHECK(bare.filename.empty());
    }
}

TEST_CASE("parse_content_range", "[http]") {
    CHECK(parse_content_range("bytes 100-199/1000") == 100u);
    CHECK(parse_content_range("Bytes 0-0/1") == 0u);
    CHECK(parse_content_range("bytes=40000-99999/100000") == 40000u);
    CHECK(!parse_content_range("bytes */1000").has_value());
    CHECK(!parse_content_range("items 1-2/3").has_value());
    CHECK(!parse_content_range("bytes 12").has_value());
    CHECK(!parse_content_range("").has_value());

    SECTION("finish_response records the start") {
        HttpResponse response;
        response.headers = {{"content-range", "bytes 2048-4095/8192"}};
        finish_response(response);
        CHECK(response.range_start == 2048u);

        HttpResponse plain;
        finish_response(plain);
        CHECK(!plain.range_start.has_value());
    }
}

TEST_CASE("ByteRange formatting", "[http]") {
    CHECK(ByteRange{0, 99}.to_string() == "0-99");
    CHECK(ByteRange{500, std::nullopt}.to_string() == "500-");
    CHECK(ByteRange{500, std::nullopt}.header_value() == "bytes=500-");
}

TEST_CASE("Filename derivation", "[http]") {
    SECTION("Content-Disposition first") {
        HttpResponse response;
        response.filename = "named.iso";
        CHECK(derive_filename(response, "https://example.com/dl?id=3") == "named.iso");
    }

    SECTION("Then the resolved URL") {
        HttpResponse response;
        CHECK(derive_filename(response, "https://cdn.example.com/files/v2/tool.tar.gz?sig=x")
              == "tool.tar.gz");
    }

    SECTION("Then a timestamp") {
        HttpResponse response;
        auto name = derive_filename(response, "https://example.com/");
        CHECK(name.starts_with("file_"));
        CHECK(name.size() > 5);
    }

    SECTION("Directory parts never survive") {
        HttpResponse response;
        response.filename = "../../etc/passwd";
        CHECK(derive_filename(response, "https://example.com/x") == "passwd");
        CHECK(sanitize_filename("..").empty());
        CHECK(sanitize_filename("a\\b\\c.txt") == "c.txt");
        CHECK(sanitize_filename("  spaced.bin ") == "spaced.bin");
    }
}
