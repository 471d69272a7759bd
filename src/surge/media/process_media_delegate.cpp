// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/media/process_media_delegate.hpp>
#include <surge/core/error.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace surge::media {

namespace {

constexpr std::string_view PROGRESS_MARK = "surge-progress:";
constexpr std::string_view RESULT_MARK = "surge-file:";
constexpr int POLL_INTERVAL_MS = 100;
constexpr std::chrono::seconds TERMINATE_GRACE{3};
constexpr int EXEC_FAILED = 127;

// RAII file descriptor
struct Descriptor {
    int fd = -1;

    Descriptor() = default;
    explicit Descriptor(int f) : fd(f) {}
    ~Descriptor() { reset(); }

    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;

    void reset() noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// "123", "123.4" or "NA"
std::uint64_t parse_count(std::string_view text) {
    text = trim(text);
    if (text.empty() || text == "NA" || text == "None") {
        return 0;
    }
    std::string copy(text);
    char* end = nullptr;
    double value = std::strtod(copy.c_str(), &end);
    if (end == copy.c_str() || value < 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(value);
}

// Reap the child; SIGKILL if it ignores SIGTERM for too long
int terminate_child(pid_t pid) {
    ::kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

} // namespace

ToolLine parse_tool_line(std::string_view line) {
    ToolLine out;
    line = trim(line);

    if (line.starts_with(PROGRESS_MARK)) {
        auto body = line.substr(PROGRESS_MARK.size());
        auto slash = body.find('/');
        out.kind = ToolLine::Kind::progress;
        out.progress.downloaded_bytes = parse_count(body.substr(0, slash));
        if (slash != std::string_view::npos) {
            out.progress.total_bytes = parse_count(body.substr(slash + 1));
        }
        return out;
    }

    if (line.starts_with(RESULT_MARK)) {
        out.kind = ToolLine::Kind::result;
        out.text = std::string(trim(line.substr(RESULT_MARK.size())));
        return out;
    }

    // [download] Destination: /path/Video.f137.mp4
    constexpr std::string_view DESTINATION = "Destination:";
    if (line.starts_with("[download]")) {
        auto pos = line.find(DESTINATION);
        if (pos != std::string_view::npos) {
            out.kind = ToolLine::Kind::destination;
            out.text = std::string(trim(line.substr(pos + DESTINATION.size())));
            return out;
        }
    }

    // [Merger] Merging formats into "/path/Video.mp4"
    if (line.starts_with("[Merger]")) {
        auto open = line.find('"');
        auto close = line.rfind('"');
        if (open != std::string_view::npos && close > open) {
            out.kind = ToolLine::Kind::destination;
            out.text = std::string(line.substr(open + 1, close - open - 1));
            return out;
        }
    }

    if (line.starts_with("ERROR:")) {
        out.kind = ToolLine::Kind::error;
        out.text = std::string(line);
        return out;
    }

    out.text = std::string(line);
    return out;
}

//=============================================================================
// ProcessMediaDelegate
//=============================================================================

ProcessMediaDelegate::ProcessMediaDelegate(std::string tool)
    : tool_(std::move(tool)) {}

std::vector<std::string> ProcessMediaDelegate::arguments(const MediaRequest& request) const {
    std::string output = request.output_dir;
    if (!output.empty() && output.back() != '/') {
        output += '/';
    }
    output += request.filename.empty() ? std::string("%(title)s.%(ext)s") : request.filename;

    std::vector<std::string> args{
        tool_,
        "--newline",
        "--no-playlist",
        "--no-colors",
        "--progress-template",
        "download:" + std::string(PROGRESS_MARK)
            + "%(progress.downloaded_bytes)s/%(progress.total_bytes,progress.total_bytes_estimate)s",
        "--print",
        "after_move:" + std::string(RESULT_MARK) + "%(filepath)s",
        "--merge-output-format", "mp4",
        "-o", output,
    };
    if (!request.format_id.empty()) {
        args.push_back("-f");
        args.push_back(request.format_id);
    }
    for (const auto& [name, value] : request.headers) {
        args.push_back("--add-header");
        args.push_back(name + ":" + value);
    }
    args.push_back(request.url);
    return args;
}

std::expected<std::string, MediaError>
ProcessMediaDelegate::fetch(const MediaRequest& request,
                            const core::CancelToken& token,
                            const MediaCallbacks& callbacks) noexcept {
    try {
        auto args = arguments(request);
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return std::unexpected(MediaError{make_error_code(core::DownloadErrc::delegate_failed),
                                              "Cannot create pipe"});
        }
        Descriptor read_end(fds[0]);
        Descriptor write_end(fds[1]);

        spdlog::debug("Starting {} for {}", tool_, request.url);

        pid_t pid = ::fork();
        if (pid < 0) {
            return std::unexpected(MediaError{make_error_code(core::DownloadErrc::delegate_failed),
                                              "Cannot start " + tool_});
        }
        if (pid == 0) {
            // Child: stdout and stderr into the pipe
            ::dup2(write_end.fd, STDOUT_FILENO);
            ::dup2(write_end.fd, STDERR_FILENO);
            ::execvp(argv[0], argv.data());
            ::_exit(EXEC_FAILED);
        }
        write_end.reset();

        std::string pending;
        std::string destination;
        std::string result_path;
        std::string last_error;
        std::string last_line;
        bool aborted = false;

        auto handle_line = [&](std::string_view text) {
            auto line = parse_tool_line(text);
            switch (line.kind) {
                case ToolLine::Kind::progress:
                    if (callbacks.progress) callbacks.progress(line.progress);
                    break;
                case ToolLine::Kind::destination:
                    destination = line.text;
                    if (callbacks.destination) callbacks.destination(destination);
                    break;
                case ToolLine::Kind::result:
                    result_path = line.text;
                    break;
                case ToolLine::Kind::error:
                    last_error = line.text;
                    break;
                case ToolLine::Kind::other:
                    if (!line.text.empty()) last_line = line.text;
                    break;
            }
        };

        char buffer[4096];
        while (true) {
            if (token.requested()) {
                aborted = true;
                break;
            }

            pollfd pfd{read_end.fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t n = ::read(read_end.fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (n == 0) {
                break;  // EOF: child closed its output
            }

            pending.append(buffer, static_cast<std::size_t>(n));
            std::size_t start = 0;
            for (std::size_t i = 0; i < pending.size(); ++i) {
                if (pending[i] == '\n' || pending[i] == '\r') {
                    handle_line(std::string_view(pending).substr(start, i - start));
                    start = i + 1;
                }
            }
            pending.erase(0, start);
        }
        if (!pending.empty() && !aborted) {
            handle_line(pending);
        }

        if (aborted) {
            terminate_child(pid);
            return std::unexpected(MediaError{make_error_code(core::DownloadErrc::cancelled), {}});
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }

        if (WIFEXITED(status) && WEXITSTATUS(status) == EXEC_FAILED && destination.empty()) {
            return std::unexpected(MediaError{make_error_code(core::DownloadErrc::delegate_unavailable),
                                              tool_ + " could not be started"});
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::string message = !last_error.empty() ? last_error
                                : !last_line.empty() ? last_line
                                : tool_ + " exited abnormally";
            return std::unexpected(MediaError{make_error_code(core::DownloadErrc::delegate_failed),
                                              std::move(message)});
        }

        if (result_path.empty()) {
            result_path = destination;
        }
        if (result_path.empty()) {
            return std::unexpected(MediaError{make_error_code(core::DownloadErrc::delegate_failed),
                                              tool_ + " reported no output file"});
        }
        return result_path;
    } catch (const std::exception& e) {
        return std::unexpected(MediaError{make_error_code(core::DownloadErrc::delegate_failed), e.what()});
    }
}

} // namespace surge::media
