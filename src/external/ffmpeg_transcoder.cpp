/**
 * @file    ffmpeg_transcoder.cpp
 * @brief   Video transcoding through the ffmpeg CLI
 * @license MIT
 */

#include "external/external_tools.hpp"
#include "external/process_runner.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <vector>

namespace nxc::external {

namespace {

// "2500k", "2M", "128000"
bool is_bitrate(std::string_view value) noexcept {
    if (value.empty() || value.size() > 12) return false;
    std::size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits == 0) return false;
    const std::string_view unit = value.substr(digits);
    return unit.empty() || unit == "k" || unit == "K" || unit == "m" || unit == "M";
}

void check_bitrate(const std::optional<std::string>& value, std::string_view field) {
    if (value && !is_bitrate(*value)) {
        throw PipelineError(ErrorKind::Validation,
                            fmt::format("Field \"{}\" must look like 2500k", field), *value);
    }
}

}  // anonymous namespace

FfmpegTranscoder::FfmpegTranscoder(std::string executable, const TempWorkspace& workspace)
    : executable_(std::move(executable))
    , workspace_(workspace) {}

ToolOutput FfmpegTranscoder::transcode(const Bytes& media, const TranscodeOptions& options) {
    const std::string container = format_token(options.container, "format", "mp4");
    check_bitrate(options.video_bitrate, "videoBitrate");
    check_bitrate(options.audio_bitrate, "audioBitrate");

    const ScopedTempFile input = workspace_.acquire_file();
    const ScopedTempFile output = workspace_.acquire_file("." + container);
    input.write(media);

    std::vector<std::string> argv = {
        executable_, "-hide_banner", "-nostdin", "-loglevel", "error",
        "-y", "-i", input.path().string()
    };
    if (options.video_bitrate) {
        argv.insert(argv.end(), {"-b:v", *options.video_bitrate});
    }
    if (options.audio_bitrate) {
        argv.insert(argv.end(), {"-b:a", *options.audio_bitrate});
    }
    argv.push_back(output.path().string());

    spdlog::info("ffmpeg: start ({} bytes -> {})", media.size(), container);
    const auto start_time = std::chrono::steady_clock::now();

    const CommandResult run = run_command(argv);
    if (run.exit_code == kCommandNotFound) {
        throw PipelineError(ErrorKind::ExternalTool, "Video converter is not available",
                            executable_ + " not found");
    }
    if (!run.ok()) {
        spdlog::error("ffmpeg: error (exit {}): {}", run.exit_code, run.output);
        throw PipelineError(ErrorKind::ExternalTool, "Failed to convert the video", run.output);
    }

    ToolOutput result;
    result.data = output.read();
    if (result.data.empty()) {
        throw PipelineError(ErrorKind::ExternalTool, "Failed to convert the video",
                            "ffmpeg produced an empty file");
    }
    result.content_type = "video/" + container;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("ffmpeg: end ({} bytes in {} ms)", result.data.size(), elapsed);
    return result;
}

}  // namespace nxc::external
