// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/media/process_media_delegate.hpp>
#include <surge/media/streaming_delegate_provider.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <filesystem>

using namespace surge::core;
using namespace surge::media;
using namespace surge::test;

namespace {

constexpr auto VIDEO_URL = "https://www.youtube.com/watch?v=abc123";

std::shared_ptr<Task> media_task(const TempDir& dir, std::string filename = {}) {
    TransferRequest request;
    request.url = VIDEO_URL;
    request.destination = dir.str();
    request.filename = std::move(filename);
    request.format_id = "22";
    return std::make_shared<Task>("media", *Url::parse(VIDEO_URL), request);
}

bool contains(const std::vector<std::string>& args, std::string_view value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

TEST_CASE("StreamingDelegateProvider host matching", "[media]") {
    StreamingDelegateProvider provider(std::make_shared<FakeMediaDelegate>(), {"youtube.com", "youtu.be"});
    CHECK(provider.can_handle(*Url::parse("https://www.youtube.com/watch?v=1")));
    CHECK(provider.can_handle(*Url::parse("https://youtu.be/1")));
    CHECK(!provider.can_handle(*Url::parse("https://notyoutube.com/watch")));
    CHECK(!provider.can_handle(*Url::parse("https://example.com/video.mp4")));
    CHECK(!provider.resumable());
    CHECK(provider.name() == "media");
}

TEST_CASE("StreamingDelegateProvider transfer", "[media]") {
    TempDir dir;
    auto delegate = std::make_shared<FakeMediaDelegate>();
    StreamingDelegateProvider provider(delegate, {"youtube.com"});
    CancelToken token;
    int progress_calls = 0;
    int checkpoints = 0;
    TransferHooks hooks{[&](Task&) { ++progress_calls; }, [&](Task&) { ++checkpoints; }};

    SECTION("Delegate output becomes the artifact") {
        auto task = media_task(dir);
        REQUIRE(!provider.resolve(*task, token));
        CHECK(task->resolved_url() == VIDEO_URL);
        CHECK(!task->accepts_ranges());

        REQUIRE(!provider.download(*task, token, hooks));
        auto expected = dir.file("Clip.mp4");
        CHECK(task->final_path() == expected);
        CHECK(task->temp_path() == expected);
        CHECK(task->filename() == "Clip.mp4");
        CHECK(task->total_size() == 2 * delegate->stream_size);
        CHECK(task->verified() == task->total_size());
        CHECK(task->snapshot().category == "Video");
        CHECK(progress_calls == 10);
        CHECK(checkpoints == 2);

        auto requests = delegate->requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].output_dir == dir.str());
        CHECK(requests[0].filename.empty());
        CHECK(requests[0].format_id == "22");
    }

    SECTION("Caller filename goes to the delegate and stays") {
        auto task = media_task(dir, "talk.mp4");
        REQUIRE(!provider.resolve(*task, token));
        REQUIRE(!provider.download(*task, token, hooks));
        CHECK(delegate->requests()[0].filename == "talk.mp4");
        CHECK(task->filename() == "talk.mp4");
        CHECK(std::filesystem::exists(dir.file("talk.mp4")));
    }

    SECTION("Delegate failure carries its message") {
        delegate->failure = MediaError{make_error_code(DownloadErrc::delegate_failed),
                                       "ERROR: Video unavailable"};
        auto task = media_task(dir);
        REQUIRE(!provider.resolve(*task, token));
        CHECK(provider.download(*task, token, hooks) == DownloadErrc::delegate_failed);
        CHECK(task->error() == "ERROR: Video unavailable");
    }

    SECTION("discard removes what the tool left") {
        auto task = media_task(dir);
        task->temp_path(dir.file("Clip.mp4"));
        write_file(dir.file("Clip.mp4.part"), "x");
        write_file(dir.file("Clip.mp4.ytdl"), "x");
        provider.discard(*task);
        CHECK(!std::filesystem::exists(dir.file("Clip.mp4.part")));
        CHECK(!std::filesystem::exists(dir.file("Clip.mp4.ytdl")));
        CHECK(task->temp_path().empty());
    }
}

TEST_CASE("parse_tool_line", "[media]") {
    SECTION("Progress template") {
        auto line = parse_tool_line("surge-progress:1048576/4194304");
        CHECK(line.kind == ToolLine::Kind::progress);
        CHECK(line.progress.downloaded_bytes == 1048576);
        CHECK(line.progress.total_bytes == 4194304);
    }

    SECTION("Progress with estimated or missing total") {
        auto est = parse_tool_line("surge-progress:100/2500.7");
        CHECK(est.progress.total_bytes == 2500);
        auto na = parse_tool_line("surge-progress:100/NA");
        CHECK(na.progress.downloaded_bytes == 100);
        CHECK(na.progress.total_bytes == 0);
    }

    SECTION("Destination and merger lines") {
        auto dest = parse_tool_line("[download] Destination: /tmp/out/Video.f137.mp4");
        CHECK(dest.kind == ToolLine::Kind::destination);
        CHECK(dest.text == "/tmp/out/Video.f137.mp4");

        auto merge = parse_tool_line(R"([Merger] Merging formats into "/tmp/out/Video.mp4")");
        CHECK(merge.kind == ToolLine::Kind::destination);
        CHECK(merge.text == "/tmp/out/Video.mp4");
    }

    SECTION("Final path, errors and noise") {
        auto result = parse_tool_line("surge-file:/tmp/out/Video.mp4\r");
        CHECK(result.kind == ToolLine::Kind::result);
        CHECK(result.text == "/tmp/out/Video.mp4");

        auto error = parse_tool_line("ERROR: [youtube] abc: Private video");
        CHECK(error.kind == ToolLine::Kind::error);
        CHECK(error.text == "ERROR: [youtube] abc: Private video");

        CHECK(parse_tool_line("[youtube] abc: Downloading webpage").kind == ToolLine::Kind::other);
    }
}

TEST_CASE("ProcessMediaDelegate command line", "[media]") {
    ProcessMediaDelegate delegate("yt-dlp");

    MediaRequest request;
    request.url = VIDEO_URL;
    request.output_dir = "/data/videos";

    SECTION("Defaults") {
        auto args = delegate.arguments(request);
        REQUIRE(!args.empty());
        CHECK(args.front() == "yt-dlp");
        CHECK(args.back() == VIDEO_URL);
        CHECK(contains(args, "--newline"));
        CHECK(contains(args, "--no-playlist"));
        CHECK(contains(args, "/data/videos/%(title)s.%(ext)s"));
        CHECK(contains(args, "mp4"));
        CHECK(!contains(args, "-f"));
    }

    SECTION("Format, filename and headers") {
        request.filename = "talk.mp4";
        request.format_id = "137+140";
        request.headers = {{"Referer", "https://example.com"}};
        auto args = delegate.arguments(request);
        CHECK(contains(args, "/data/videos/talk.mp4"));
        auto f = std::find(args.begin(), args.end(), "-f");
        REQUIRE(f != args.end());
        CHECK(*(f + 1) == "137+140");
        CHECK(contains(args, "Referer:https://example.com"));
    }
}

TEST_CASE("ProcessMediaDelegate reports a missing tool", "[media]") {
    TempDir dir;
    ProcessMediaDelegate delegate("surge-no-such-tool-for-tests");
    MediaRequest request;
    request.url = VIDEO_URL;
    request.output_dir = dir.str();
    CancelToken token;

    auto result = delegate.fetch(request, token, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == DownloadErrc::delegate_unavailable);
}
