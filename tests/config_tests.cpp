// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include "fakes.hpp"

using namespace surge::core;
using surge::test::TempDir;

TEST_CASE("EngineConfig defaults", "[config]") {
    EngineConfig cfg;
    CHECK(cfg.max_active == 3);
    CHECK(cfg.emit_interval == std::chrono::milliseconds(400));
    CHECK(cfg.chunk_attempts == 3);
    CHECK(cfg.stream_attempts == 3);
    CHECK(cfg.state_file.empty());
    CHECK(!cfg.download_dir.empty());
    CHECK(cfg.media_hosts == std::vector<std::string>{"youtube.com", "youtu.be"});
}

TEST_CASE("EngineConfig::parse", "[config]") {
    SECTION("Partial object keeps other defaults") {
        auto cfg = EngineConfig::parse(R"({"max_active": 5, "emit_interval_ms": 250,
                                           "media_hosts": ["vimeo.com"], "log_level": "debug"})");
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_active == 5);
        CHECK(cfg->emit_interval == std::chrono::milliseconds(250));
        CHECK(cfg->media_hosts == std::vector<std::string>{"vimeo.com"});
        CHECK(cfg->log_level == "debug");
        CHECK(cfg->stream_attempts == 3);
    }

    SECTION("Durations and paths") {
        auto cfg = EngineConfig::parse(R"({"retry_backoff_ms": 5, "state_file": "/var/lib/surge/state.json",
                                           "download_dir": "/data", "stall_timeout_sec": 60})");
        REQUIRE(cfg.has_value());
        CHECK(cfg->retry_backoff == std::chrono::milliseconds(5));
        CHECK(cfg->state_file == "/var/lib/surge/state.json");
        CHECK(cfg->download_dir == "/data");
        CHECK(cfg->stall_timeout_sec == 60);
    }

    SECTION("Malformed input") {
        CHECK(EngineConfig::parse("{not json").error() == DownloadErrc::invalid_config);
        CHECK(EngineConfig::parse("[1, 2]").error() == DownloadErrc::invalid_config);
        CHECK(EngineConfig::parse(R"({"max_active": "three"})").error() == DownloadErrc::invalid_config);
        CHECK(EngineConfig::parse(R"({"max_active": 0})").error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::load", "[config]") {
    TempDir dir;

    SECTION("Missing file") {
        auto cfg = EngineConfig::load(dir.file("nope.json"));
        REQUIRE(!cfg.has_value());
        CHECK(cfg.error() == surge::disk::DiskErrc::file_not_found);
    }

    SECTION("Reads a file") {
        surge::test::write_file(dir.file("surge.json"), R"({"max_active": 2, "user_agent": "surge-test"})");
        auto cfg = EngineConfig::load(dir.file("surge.json"));
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_active == 2);
        CHECK(cfg->user_agent == "surge-test");
    }
}
