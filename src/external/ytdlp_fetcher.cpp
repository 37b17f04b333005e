/**
 * @file    ytdlp_fetcher.cpp
 * @brief   Remote video download through yt-dlp
 * @license MIT
 */

#include "external/external_tools.hpp"
#include "external/process_runner.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <vector>

namespace fs = std::filesystem;

namespace nxc::external {

namespace {

// Best mp4 video + m4a audio, or best single mp4
constexpr const char* kFormatSelector = "bv[ext=mp4]+ba[ext=m4a]/b[ext=mp4]";

}  // anonymous namespace

YtDlpFetcher::YtDlpFetcher(std::string executable, const TempWorkspace& workspace)
    : executable_(std::move(executable))
    , workspace_(workspace) {}

ToolOutput YtDlpFetcher::fetch(std::string_view url, std::string_view container) {
    if (!is_fetchable_url(url)) {
        throw PipelineError(ErrorKind::Validation,
                            "Parameter \"url\" must be an http(s) URL", std::string(url));
    }
    const std::string format = format_token(container, "format", "mp4");

    const ScopedTempDir work = workspace_.acquire_dir();
    const fs::path output = work.path() / ("media." + format);

    const std::vector<std::string> argv = {
        executable_,
        "--no-playlist", "--no-progress", "--quiet", "--no-warnings",
        "-f", kFormatSelector,
        "--merge-output-format", format,
        "-o", output.string(),
        "--", std::string(url)
    };

    spdlog::info("yt-dlp: downloading {} as {}", url, format);

    const CommandResult run = run_command(argv);
    if (run.exit_code == kCommandNotFound) {
        throw PipelineError(ErrorKind::ExternalTool, "Media downloader is not available",
                            executable_ + " not found");
    }
    if (!run.ok() || !fs::exists(output)) {
        spdlog::error("yt-dlp: error (exit {}): {}", run.exit_code, run.output);
        throw PipelineError(ErrorKind::ExternalTool,
                            "Failed to download or process the video",
                            run.output.empty() ? "no output produced" : run.output);
    }

    ToolOutput result;
    result.data = read_file(output);
    result.content_type = "video/" + format;

    spdlog::info("yt-dlp: download complete ({} bytes)", result.data.size());
    return result;
}

}  // namespace nxc::external
