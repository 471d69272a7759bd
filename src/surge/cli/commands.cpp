// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <surge/cli/progress_bar.hpp>
#include <surge/core/error.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/ranged_http_provider.hpp>
#include <surge/core/scheduler.hpp>
#include <surge/core/telemetry.hpp>
#include <surge/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

using namespace surge::core;

namespace chrono = std::chrono;

namespace surge::cli {

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_interrupt(int) {
    g_interrupted.store(true);
}

bool parse_count(const char* text, std::uint32_t& out) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value == 0
        || value > static_cast<unsigned long>(MAX_ACTIVE_LIMIT)) {
        return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

// Progress bars for the terminal; one line per finished task
class ConsoleView {
public:
    void on_event(const TaskSnapshot& s) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& bar = bars_.try_emplace(s.id, label_for(s)).first->second;
        if (!s.filename.empty()) {
            bar.label(s.filename);
        }

        switch (s.status) {
            case TaskStatus::downloading:
                bar.update(s.downloaded_bytes, s.total_bytes, s.speed_bps);
                break;
            case TaskStatus::completed:
                bar.finish("done (" + format_bytes(s.total_bytes) + ")");
                break;
            case TaskStatus::failed:
                bar.finish("failed: " + s.error);
                break;
            case TaskStatus::cancelled:
                bar.finish("cancelled");
                break;
            case TaskStatus::paused:
                bar.finish("paused at " + format_bytes(s.verified_bytes));
                break;
            default:
                break;
        }
    }

private:
    static std::string label_for(const TaskSnapshot& s) {
        return s.filename.empty() ? s.url : s.filename;
    }

    std::mutex mutex_;
    std::map<std::string, ProgressBar> bars_;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = "Missing value for " + std::string(name);
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.output_dir = v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_file = v;
        } else if (arg == "-s" || arg == "--state") {
            if (auto v = value_of(i, arg)) args.state_file = v;
        } else if (arg == "-j" || arg == "--jobs") {
            if (auto v = value_of(i, arg); v && !parse_count(v, args.jobs)) {
                args.error = "Invalid job count: " + std::string(v);
            }
        } else if (arg == "-n" || arg == "--connections") {
            if (auto v = value_of(i, arg); v && !parse_count(v, args.connections)) {
                args.error = "Invalid connection count: " + std::string(v);
            }
        } else if (arg == "--single") {
            args.single = true;
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            // URL arguments (no option)
            args.urls.push_back(arg);
        } else {
            args.error = "Unknown argument: " + arg;
        }

        if (!args.error.empty()) {
            return args;
        }
    }

    return args;
}

std::expected<EngineConfig, std::error_code> build_config(const CliArgs& args) noexcept {
    EngineConfig config;
    if (!args.config_file.empty()) {
        auto loaded = EngineConfig::load(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    try {
        if (!args.output_dir.empty()) config.download_dir = args.output_dir;
        if (!args.state_file.empty()) config.state_file = args.state_file;
        if (args.jobs > 0) config.max_active = args.jobs;
    } catch (const std::exception&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
    return config;
}

void configure_logging(const CliArgs& args, const EngineConfig& config) noexcept {
    try {
        // stdout belongs to progress bars and JSON events
        auto logger = spdlog::stderr_color_mt("surge");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        auto level = spdlog::level::from_str(config.log_level);
        if (args.verbose) {
            level = spdlog::level::debug;
        } else if (args.quiet) {
            level = spdlog::level::warn;
        } else if (!args.json && level == spdlog::level::info) {
            // Progress bars already show what info would say
            level = spdlog::level::warn;
        }
        spdlog::set_level(level);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Warning: logging setup failed: " << e.what() << std::endl;
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, const EngineConfig& config) noexcept {
    try {
        std::shared_ptr<TelemetrySink> sink;
        auto view = std::make_shared<ConsoleView>();
        if (args.json) {
            sink = std::make_shared<CallbackSink>([](const TaskSnapshot& s) {
                std::cout << nlohmann::json(s).dump() << std::endl;
            });
        } else if (!args.quiet) {
            sink = std::make_shared<CallbackSink>([view](const TaskSnapshot& s) { view->on_event(s); });
        }

        Scheduler scheduler(config, sink);

        if (!args.output_file.empty() && args.urls.size() > 1) {
            spdlog::warn("--output ignored with several URLs");
        }

        // Tasks this run is responsible for
        std::vector<std::string> ids;

        // Pick up where an earlier run was interrupted
        for (const auto& snapshot : scheduler.list()) {
            if (snapshot.status == TaskStatus::paused) {
                if (auto ec = scheduler.resume(snapshot.id)) {
                    spdlog::warn("Cannot resume {}: {}", snapshot.id, ec.message());
                    continue;
                }
                ids.push_back(snapshot.id);
            }
        }

        bool all_accepted = true;
        for (const auto& url : args.urls) {
            TransferRequest request;
            request.url = url;
            request.overrides.force_single_stream = args.single;
            request.overrides.max_workers = args.connections;
            if (args.urls.size() == 1 && !args.output_file.empty()) {
                std::filesystem::path output(args.output_file);
                request.filename = sanitize_filename(output.filename().string());
                if (output.has_parent_path()) {
                    request.destination = output.parent_path().string();
                }
            }

            auto id = scheduler.enqueue(std::move(request));
            if (!id) {
                std::cerr << "Error: " << url << ": " << id.error().message() << std::endl;
                all_accepted = false;
                continue;
            }
            ids.push_back(std::move(*id));
        }

        auto previous = std::signal(SIGINT, on_interrupt);
        while (!scheduler.wait_idle(chrono::milliseconds(200))) {
            if (g_interrupted.load()) {
                std::cerr << "\nInterrupted, pausing transfers" << std::endl;
                break;
            }
        }
        scheduler.shutdown();
        std::signal(SIGINT, previous);

        bool all_completed = all_accepted;
        for (const auto& id : ids) {
            auto snapshot = scheduler.get(id);
            if (!snapshot || snapshot->status != TaskStatus::completed) {
                all_completed = false;
            }
        }
        return all_completed ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }
}

CliResult info(const std::string& url, const EngineConfig& config) noexcept {
    HttpOptions options;
    options.user_agent = config.user_agent;
    options.connect_timeout_sec = config.connect_timeout_sec;
    options.stall_timeout_sec = config.stall_timeout_sec;
    HttpSession session(options);

    CancelToken token;
    HttpRequest request;
    request.url = url;
    auto response = session.head(request, token);

    if (!response) {
        std::cout << "Error: " << response.error().message() << std::endl;
        return std::unexpected(response.error());
    }

    std::cout << "URL: " << url << std::endl;
    std::cout << "Resolved: " << response->effective_url << std::endl;
    std::cout << "Status: " << response->status_code << std::endl;
    std::cout << "Filename: " << derive_filename(*response, response->effective_url) << std::endl;
    std::cout << "Content-Type: " << response->content_type << std::endl;
    std::cout << "Content-Length: " << format_total(response->content_length) << std::endl;
    std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Surge " << surge::version.to_string() << " - multi-connection download engine\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save a single URL under this name\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -c, --config <FILE>     Read settings from a JSON file\n";
    std::cout << "  -s, --state <FILE>      Persist tasks here and resume them\n";
    std::cout << "  -j, --jobs <N>          Concurrent transfers (default: 3)\n";
    std::cout << "  -n, --connections <N>   At most N connections per transfer\n";
    std::cout << "      --single            One connection per transfer\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "      --json              Print one JSON event per line\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -j 2 -s state.json https://a.example/x.iso https://b.example/y.iso\n";
}

void print_version() noexcept {
    std::cout << "Surge " << surge::version.to_string() << std::endl;
    std::cout << "Built " << surge::BUILD_DATE << " with C++23, libcurl, spdlog\n";
}

} // namespace surge::cli
