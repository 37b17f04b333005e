/**
 * @file    process_runner.cpp
 * @brief   Blocking invocation of external tools implementation
 * @license MIT
 */

#include "external/process_runner.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/wait.h>

namespace nxc::external {

namespace {

// Keep only the tail of chatty tools (ffmpeg progress, office warnings)
constexpr std::size_t kMaxCapturedOutput = 64 * 1024;

}  // anonymous namespace

std::string escape_arg(std::string_view arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string build_command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        line += escape_arg(arg);
    }
    return line;
}

CommandResult run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw PipelineError(ErrorKind::ExternalTool, "No command to run");
    }

    const std::string command = build_command_line(argv) + " 2>&1";
    spdlog::debug("exec: {}", command);

    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        throw PipelineError(ErrorKind::ExternalTool,
                            "Failed to start " + argv.front(), std::strerror(errno));
    }

    CommandResult result;
    std::array<char, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
        if (result.output.size() > 2 * kMaxCapturedOutput) {
            result.output.erase(0, result.output.size() - kMaxCapturedOutput);
        }
    }
    if (result.output.size() > kMaxCapturedOutput) {
        result.output.erase(0, result.output.size() - kMaxCapturedOutput);
    }

    const int status = ::pclose(pipe);
    if (status == -1) {
        throw PipelineError(ErrorKind::ExternalTool,
                            "Failed to wait for " + argv.front(), std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    spdlog::debug("exit: {} -> {}", argv.front(), result.exit_code);
    return result;
}

}  // namespace nxc::external
