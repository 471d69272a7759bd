// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/task.hpp>
#include <surge/core/config.hpp>

using namespace surge::core;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<Task> make_task(std::string filename = {}) {
    TransferRequest request;
    request.url = "https://example.com/file.zip";
    request.destination = "/tmp/out";
    request.filename = std::move(filename);
    return std::make_shared<Task>("t1", *Url::parse(request.url), request);
}

} // namespace

TEST_CASE("TaskStatus transitions", "[task]") {
    using enum TaskStatus;

    SECTION("Legal paths") {
        CHECK(can_transition(queued, resolving));
        CHECK(can_transition(queued, downloading));
        CHECK(can_transition(resolving, downloading));
        CHECK(can_transition(downloading, completed));
        CHECK(can_transition(downloading, paused));
        CHECK(can_transition(paused, queued));
        CHECK(can_transition(failed, queued));
        CHECK(can_transition(paused, cancelled));
    }

    SECTION("Terminal states stay terminal") {
        for (auto to : {queued, resolving, downloading, paused, failed, cancelled}) {
            CHECK(!can_transition(completed, to));
        }
        for (auto to : {queued, resolving, downloading, paused, completed, failed}) {
            CHECK(!can_transition(cancelled, to));
        }
    }

    SECTION("Only a transfer can complete") {
        CHECK(!can_transition(queued, completed));
        CHECK(!can_transition(paused, completed));
        CHECK(!can_transition(resolving, completed));
    }

    SECTION("Task::transition_from checks the current state") {
        auto task = make_task();
        CHECK(!task->transition_from(TaskStatus::resolving, TaskStatus::downloading));
        CHECK(task->transition_from(TaskStatus::queued, TaskStatus::resolving));
        CHECK(task->status() == TaskStatus::resolving);
        CHECK(!task->transition(TaskStatus::completed));
    }

    SECTION("Names round-trip") {
        for (auto s : {queued, resolving, downloading, paused, completed, failed, cancelled}) {
            CHECK(parse_status(to_string(s)) == s);
        }
        CHECK(to_string(downloading) == "Downloading");
        CHECK(!parse_status("Running").has_value());
    }
}

TEST_CASE("Task counters", "[task]") {
    auto task = make_task();

    SECTION("Verified never passes a known total") {
        task->total_size(1000);
        CHECK(!task->mark_verified(600));
        CHECK(task->mark_verified(401) == DownloadErrc::invalid_range);
        CHECK(task->verified() == 600);
        CHECK(!task->mark_verified(400));
        CHECK(task->verified() == 1000);
    }

    SECTION("Unknown total accepts anything") {
        CHECK(!task->mark_verified(123456));
        CHECK(task->verified() == 123456);
    }

    SECTION("A chunk counts once") {
        task->total_size(100);
        CHECK(!task->mark_chunk_verified(0, 50));
        CHECK(task->mark_chunk_verified(0, 50) == DownloadErrc::invalid_range);
        CHECK(!task->mark_chunk_verified(1, 50));
        CHECK(task->completed_chunks() == std::set<std::uint32_t>{0, 1});
        CHECK(task->verified() == 100);
    }

    SECTION("Rewind and reset") {
        task->total_size(100);
        task->mark_progress(80);
        REQUIRE(!task->mark_verified(30));
        task->rewind_progress_to_verified();
        CHECK(task->downloaded() == 30);

        REQUIRE(!task->mark_chunk_verified(2, 10));
        task->reset_counters();
        CHECK(task->downloaded() == 0);
        CHECK(task->verified() == 0);
        CHECK(task->completed_chunks().empty());
    }

    SECTION("Reset forgets the chunk plan") {
        task->chunk_workers(8);
        task->reset_counters();
        CHECK(task->chunk_workers() == 0);
    }
}

TEST_CASE("Task speed EMA", "[task]") {
    auto task = make_task();
    auto t = Task::clock::now();
    task->reset_speed_metrics(t);

    SECTION("Constant throughput converges within 10%") {
        constexpr double rate = 2.0 * MiB;  // bytes per second
        for (int i = 0; i < 8; ++i) {
            t += 400ms;
            task->mark_progress(static_cast<std::uint64_t>(rate * 0.4));
            task->sample_speed(t);
        }
        CHECK(task->speed() == Catch::Approx(rate).epsilon(0.10));
    }

    SECTION("First sample is taken as is, later ones are smoothed") {
        t += 1s;
        task->mark_progress(1000);
        task->sample_speed(t);
        CHECK(task->speed() == Catch::Approx(1000.0));

        t += 1s;
        task->mark_progress(2000);
        task->sample_speed(t);
        CHECK(task->speed() == Catch::Approx(0.7 * 1000.0 + 0.3 * 2000.0));
    }

    SECTION("Counter reset does not go negative") {
        t += 1s;
        task->mark_progress(5000);
        task->sample_speed(t);
        task->reset_counters();
        t += 1s;
        task->sample_speed(t);
        CHECK(task->speed() >= 0.0);
        CHECK(task->speed() == Catch::Approx(0.7 * 5000.0));
    }
}

TEST_CASE("Task snapshot", "[task]") {
    auto task = make_task("report.pdf");
    task->total_size(4 * MiB);
    task->mark_progress(MiB);

    auto snap = task->snapshot();
    CHECK(snap.id == "t1");
    CHECK(snap.filename == "report.pdf");
    CHECK(snap.category == "General");
    CHECK(snap.percent == Catch::Approx(25.0));
    CHECK(snap.speed_bps == 0.0);  // Not downloading

    REQUIRE(task->transition(TaskStatus::downloading));
    REQUIRE(!task->mark_verified(4 * MiB));
    REQUIRE(task->transition(TaskStatus::completed));
    CHECK(task->snapshot().percent == 100.0);

    SECTION("Diagnostics") {
        task->begin_attempt();
        task->note_stall();
        task->note_stall();
        task->last_http_status(206);
        auto diag = task->snapshot();
        CHECK(diag.attempts == 1);
        CHECK(diag.stall_count == 2);
        CHECK(diag.http_status_last == 206);
    }
}

TEST_CASE("Task resolution state", "[task]") {
    SECTION("Caller filename counts as resolved name") {
        auto task = make_task("mine.bin");
        CHECK(task->caller_filename());
        CHECK(task->filename_resolved());
        CHECK(!task->resolved());
        task->resolved_url("https://cdn.example.com/file.zip");
        CHECK(task->resolved());
    }

    SECTION("clear_resolution forgets the resolved metadata") {
        auto task = make_task();
        task->resolved_url("https://cdn.example.com/file.zip");
        task->filename("file.zip");
        task->total_size(10);
        task->accepts_ranges(true);
        task->mode(TransferMode::single_stream);
        task->clear_resolution();
        CHECK(!task->resolved());
        CHECK(task->total_size() == 0);
        CHECK(!task->accepts_ranges());
        CHECK(task->mode() == TransferMode::chunked);
    }

    SECTION("Fresh token per attempt") {
        auto task = make_task();
        auto first = task->cancel_token();
        task->request_cancel();
        CHECK(first->requested());
        auto second = task->rearm();
        CHECK(!second->requested());
        CHECK(first->requested());
    }
}

TEST_CASE("Task record round trip keeps progress", "[task]") {
    auto task = make_task();
    task->resolved_url("https://cdn.example.com/file.zip");
    task->filename("file.zip");
    task->total_size(300);
    task->mode(TransferMode::chunked);
    task->chunk_workers(3);
    task->overrides(TransferOverrides{.max_workers = 3});
    REQUIRE(!task->mark_chunk_verified(1, 100));
    task->mark_progress(150);

    auto restored = Task::from_record(task->record());
    REQUIRE(restored);
    CHECK(restored->id() == "t1");
    CHECK(restored->verified() == 100);
    CHECK(restored->completed_chunks() == std::set<std::uint32_t>{1});
    CHECK(restored->total_size() == 300);
    CHECK(restored->filename() == "file.zip");
    CHECK(!restored->caller_filename());
    CHECK(restored->resolved());
    CHECK(restored->chunk_workers() == 3);
    CHECK(restored->overrides().max_workers == 3);
    CHECK(!restored->overrides().force_single_stream);
}

TEST_CASE("category_for", "[task]") {
    CHECK(category_for("a.zip") == "Compressed");
    CHECK(category_for("disk.ISO") == "Compressed");
    CHECK(category_for("setup.exe") == "Programs");
    CHECK(category_for("app.apk") == "Programs");
    CHECK(category_for("movie.mkv") == "Video");
    CHECK(category_for("song.flac") == "Music");
    CHECK(category_for("notes.txt") == "General");
    CHECK(category_for("README") == "General");
    CHECK(category_for("trailing.") == "General");
    CHECK(category_for("") == "General");
}

TEST_CASE("Human-readable sizes", "[task]") {
    CHECK(format_bytes(0) == "0.0 MB");
    CHECK(format_bytes(1536 * 1024) == "1.5 MB");
    CHECK(format_total(0) == "--- MB");
    CHECK(format_total(10 * MiB) == "10.0 MB");
    CHECK(format_speed(2.5 * MiB) == "2.50 MB/s");
    CHECK(format_speed(0) == "0.00 MB/s");
}
