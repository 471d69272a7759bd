// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/state_store.hpp>
#include <surge/disk/error.hpp>
#include "fakes.hpp"
#include <filesystem>

using namespace surge::core;
using surge::test::TempDir;

namespace {

TaskRecord record(std::string id, TaskStatus status) {
    TaskRecord r;
    r.id = std::move(id);
    r.url = "https://example.com/" + r.id + ".bin";
    r.destination = "/downloads";
    r.filename = r.id + ".bin";
    r.final_path = "/downloads/" + r.filename;
    r.temp_path = r.final_path + ".part";
    r.status = status;
    r.total_bytes = 1000;
    r.verified_bytes = 400;
    r.downloaded_bytes = 700;
    r.accepts_ranges = true;
    r.mode = TransferMode::chunked;
    r.completed_chunks = {0, 3};
    r.headers = {{"Cookie", "a=b"}};
    return r;
}

} // namespace

TEST_CASE("StateStore save and load", "[state]") {
    TempDir dir;
    StateStore store(dir.file("state.json"));

    SECTION("Missing file is an empty list") {
        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        CHECK(loaded->empty());
    }

    SECTION("Round trip keeps every field of a finished task") {
        auto r = record("done", TaskStatus::completed);
        r.verified_bytes = r.total_bytes;
        r.caller_filename = true;
        r.provider_hint = "http";
        r.format_id = "137+140";
        r.resolved_url = "https://cdn.example.com/done.bin";
        REQUIRE(!store.save({r}));

        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 1);
        const auto& got = loaded->front();
        CHECK(got.id == "done");
        CHECK(got.status == TaskStatus::completed);
        CHECK(got.verified_bytes == 1000);
        CHECK(got.completed_chunks == std::set<std::uint32_t>{0, 3});
        CHECK(got.headers.at("Cookie") == "a=b");
        CHECK(got.caller_filename);
        CHECK(got.provider_hint == "http");
        CHECK(got.format_id == "137+140");
        CHECK(got.resolved_url == "https://cdn.example.com/done.bin");
        CHECK(got.final_path == "/downloads/done.bin");
        CHECK(got.temp_path == "/downloads/done.bin.part");
        CHECK(got.overrides == TransferOverrides{});
        CHECK(got.chunk_workers == 0);
    }

    SECTION("Transfer overrides and the chunk plan survive") {
        auto r = record("tuned", TaskStatus::paused);
        r.overrides = TransferOverrides{.force_single_stream = false, .max_workers = 4};
        r.chunk_workers = 4;
        REQUIRE(!store.save({r}));

        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 1);
        CHECK(loaded->front().overrides.max_workers == 4);
        CHECK(!loaded->front().overrides.force_single_stream);
        CHECK(loaded->front().chunk_workers == 4);
    }

    SECTION("Records without rules load with none") {
        nlohmann::json j = record("old", TaskStatus::paused);
        j.erase("rules");
        j.erase("chunk_workers");
        surge::test::write_file(store.path(), nlohmann::json::array({j}).dump());

        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 1);
        CHECK(loaded->front().overrides == TransferOverrides{});
        CHECK(loaded->front().chunk_workers == 0);
        CHECK(loaded->front().completed_chunks == std::set<std::uint32_t>{0, 3});
    }

    SECTION("Save leaves no temp file behind") {
        REQUIRE(!store.save({record("a", TaskStatus::paused)}));
        CHECK(std::filesystem::exists(store.path()));
        CHECK(!std::filesystem::exists(store.temp_path()));
    }

    SECTION("Save replaces the previous list") {
        REQUIRE(!store.save({record("a", TaskStatus::paused), record("b", TaskStatus::failed)}));
        REQUIRE(!store.save({record("b", TaskStatus::failed)}));
        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 1);
        CHECK(loaded->front().id == "b");
    }

    SECTION("Active states come back paused") {
        REQUIRE(!store.save({record("q", TaskStatus::queued),
                             record("r", TaskStatus::resolving),
                             record("d", TaskStatus::downloading),
                             record("f", TaskStatus::failed)}));
        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 4);
        for (const auto& r : *loaded) {
            if (r.id == "f") {
                CHECK(r.status == TaskStatus::failed);
                CHECK(r.downloaded_bytes == 700);
            } else {
                CHECK(r.status == TaskStatus::paused);
                CHECK(r.downloaded_bytes == r.verified_bytes);
            }
        }
    }

    SECTION("Malformed file is reported, not thrown") {
        surge::test::write_file(store.path(), "{ this is not json");
        auto loaded = store.load();
        REQUIRE(!loaded.has_value());
        CHECK(loaded.error() == surge::disk::DiskErrc::corrupt_file);

        surge::test::write_file(store.path(), R"({"id": "x"})");
        CHECK(store.load().error() == surge::disk::DiskErrc::corrupt_file);

        surge::test::write_file(store.path(), R"([{"url": "https://example.com/a"}])");
        CHECK(store.load().error() == surge::disk::DiskErrc::corrupt_file);
    }
}

TEST_CASE("TaskRecord JSON uses stable keys", "[state]") {
    nlohmann::json j = record("k", TaskStatus::downloading);
    CHECK(j["status"] == "Downloading");
    CHECK(j["raw_verified"] == 400);
    CHECK(j["raw_total"] == 1000);
    CHECK(j["mode"] == "chunked");
    CHECK(j["path"] == "/downloads/k.bin");
    CHECK(j["rules"]["force_single"] == false);
    CHECK(j["rules"]["max_threads"] == 0);
    CHECK(j["chunk_workers"] == 0);

    j["status"] = "Sleeping";
    CHECK_THROWS(j.get<TaskRecord>());
}

TEST_CASE("coerce_on_load", "[state]") {
    auto r = coerce_on_load(record("x", TaskStatus::downloading));
    CHECK(r.status == TaskStatus::paused);
    CHECK(r.downloaded_bytes == 400);

    auto done = coerce_on_load(record("y", TaskStatus::completed));
    CHECK(done.status == TaskStatus::completed);
    CHECK(done.downloaded_bytes == 700);
}
