/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for NexusConverter.
 * "serve" runs the HTTP gateway, "compose" renders one image locally.
 */

#include "cli/cli_app.hpp"
#include "core/composition_engine.hpp"
#include "external/temp_workspace.hpp"
#include "server/gateway_server.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <optional>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace nxc::cli {

namespace {

// =============================================================================
// Banner and logging
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  NexusConverter");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n\n", kVersion);
}

struct LogOptions {
    bool verbose = false;
    bool quiet = false;
    std::string level;
};

void setup_logging(const LogOptions& options) {
    auto logger = spdlog::get("nxc");
    if (!logger) {
        logger = spdlog::stdout_color_mt("nxc");
    }
    spdlog::set_default_logger(logger);

    if (!options.level.empty()) {
        spdlog::set_level(spdlog::level::from_str(options.level));
    } else if (options.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

// =============================================================================
// serve
// =============================================================================

/**
 * Turns SIGINT/SIGTERM into GatewayServer::stop()
 *
 * The signals are blocked before the server spawns its workers, so only
 * the watcher thread ever receives them (via sigwait).
 */
class SignalWatcher {
public:
    explicit SignalWatcher(server::GatewayServer& server) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this, &server] {
            int received = 0;
            if (sigwait(&signals_, &received) == 0 && received == SIGINT) {
                spdlog::debug("Interrupted");
            }
            done_ = true;
            server.stop();
        });
    }

    ~SignalWatcher() {
        if (!done_) {
            // Wake the watcher; the signal stays blocked for every thread
            ::kill(::getpid(), SIGTERM);
        }
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t signals_{};
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int run_serve(const server::ServerConfig& config) {
    try {
        server::GatewayServer gateway(config);
        const SignalWatcher watcher(gateway);
        return gateway.run() ? 0 : 1;
    } catch (const PipelineError& e) {
        spdlog::error("Fatal error: {} ({})", e.what(), e.detail());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

// =============================================================================
// compose
// =============================================================================

struct ComposeOptions {
    std::string source;
    std::string watermark;
    std::string output;
    std::string format;
    std::optional<std::string> quality;
    std::optional<std::string> layout;
    std::optional<std::string> mode;
    std::optional<std::string> opacity;
    std::optional<std::string> scale;
    std::optional<std::string> angle;
};

int run_compose(const ComposeOptions& options) {
    try {
        const fs::path output(options.output);

        ComposeRequest request;
        request.subject = external::read_file(options.source);
        request.watermark = external::read_file(options.watermark);

        auto& fields = request.fields;
        fields[field::kFormat] = options.format.empty()
            ? std::string(to_string(format_from_extension(output)))
            : options.format;
        if (options.quality) fields[field::kQuality] = *options.quality;
        if (options.layout)  fields[field::kLayout] = *options.layout;
        if (options.mode)    fields[field::kWatermarkMode] = *options.mode;
        if (options.opacity) fields[field::kWatermarkOpacity] = *options.opacity;
        if (options.scale)   fields[field::kWatermarkScale] = *options.scale;
        if (options.angle)   fields[field::kWatermarkAngle] = *options.angle;

        spdlog::info("Composing: {} + {}", options.source, options.watermark);

        const CompositionEngine engine;
        const ImageResult result = engine.compose(request);
        if (!result.success) {
            if (result.detail.empty()) {
                spdlog::error("{}: {}", to_string(result.error), result.message);
            } else {
                spdlog::error("{}: {} ({})", to_string(result.error), result.message, result.detail);
            }
            return 1;
        }

        if (output.has_parent_path()) {
            fs::create_directories(output.parent_path());
        }
        external::write_file(output, result.data);

        fmt::print(fmt::fg(fmt::color::green), "[OK] Success: {} ({}, {} bytes)\n",
                   output.string(), result.content_type, result.data.size());
        return 0;
    } catch (const PipelineError& e) {
        spdlog::error("{}: {}", e.what(), e.detail());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

std::size_t default_threads() {
    return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

OutputFormat format_from_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" ? OutputFormat::Png : OutputFormat::Jpeg;
}

int run(int argc, char** argv) {
    CLI::App app{"NexusConverter - media conversion gateway and product image composer"};
    app.set_version_flag("-V,--version", kVersion);
    app.require_subcommand(1);

    // Verbosity
    LogOptions log_options;
    app.add_flag("-v,--verbose", log_options.verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", log_options.quiet, "Suppress all output except errors");
    app.add_option("--log-level", log_options.level, "Log level (trace, debug, info, warn, err, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "err", "critical", "off"}));

    // serve
    server::ServerConfig server_config;
    server_config.threads = default_threads();
    server_config.tmp_dir = fs::temp_directory_path() / "nexus_converter";

    auto* serve = app.add_subcommand("serve", "Start the HTTP conversion gateway");
    serve->add_option("--host", server_config.host, "Bind address")
        ->capture_default_str();
    serve->add_option("-p,--port", server_config.port, "Listen port")
        ->envname("PORT")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();
    serve->add_option("--threads", server_config.threads, "Worker threads")
        ->check(CLI::Range(std::size_t{2}, std::size_t{256}))
        ->capture_default_str();
    serve->add_option("--tmp-dir", server_config.tmp_dir, "Scratch directory for external tools")
        ->envname("NXC_TMP_DIR")
        ->capture_default_str();
    serve->add_option("--max-upload-mb", server_config.max_upload_mb, "Request body limit in MB")
        ->check(CLI::Range(std::size_t{1}, std::size_t{4096}))
        ->capture_default_str();
    serve->add_option("--ffmpeg", server_config.ffmpeg, "ffmpeg executable")
        ->capture_default_str();
    serve->add_option("--soffice", server_config.soffice, "LibreOffice executable")
        ->capture_default_str();
    serve->add_option("--yt-dlp", server_config.ytdlp, "yt-dlp executable")
        ->capture_default_str();

    // compose
    ComposeOptions compose_options;

    auto* compose = app.add_subcommand("compose", "Compose a product image from local files");
    compose->add_option("-s,--source", compose_options.source, "Subject image")
        ->required()
        ->check(CLI::ExistingFile);
    compose->add_option("-w,--watermark", compose_options.watermark, "Watermark / logo image")
        ->required()
        ->check(CLI::ExistingFile);
    compose->add_option("-o,--output", compose_options.output, "Output image file")
        ->required();
    compose->add_option("--format", compose_options.format,
        "Output format (jpeg, png); defaults to the output extension");
    compose->add_option("--quality", compose_options.quality, "JPEG quality (1-100)");
    compose->add_option("--layout", compose_options.layout, "Layout (sheet, overlay)");
    compose->add_option("--mode", compose_options.mode, "Watermark mode (diagonal, center)");
    compose->add_option("--opacity", compose_options.opacity, "Watermark opacity (0-1)");
    compose->add_option("--scale", compose_options.scale, "Watermark scale");
    compose->add_option("--angle", compose_options.angle, "Watermark angle in degrees");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    setup_logging(log_options);

    if (serve->parsed()) {
        print_banner();
        return run_serve(server_config);
    }
    return run_compose(compose_options);
}

}  // namespace nxc::cli
