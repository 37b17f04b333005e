/**
 * @file    process_runner.hpp
 * @brief   Blocking invocation of external command-line tools
 * @license MIT
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nxc::external {

// Exit code the shell reports when the executable does not exist
inline constexpr int kCommandNotFound = 127;

/**
 * Outcome of a finished process
 */
struct CommandResult {
    int exit_code{-1};
    std::string output;     // Combined stdout/stderr (tail, bounded)

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

/**
 * Quote one argument for the POSIX shell
 */
[[nodiscard]] std::string escape_arg(std::string_view arg);

/**
 * Join escaped arguments into a shell command line
 */
[[nodiscard]] std::string build_command_line(const std::vector<std::string>& argv);

/**
 * Run a command and wait for it
 *
 * A non-zero exit is reported in the result, not thrown.
 *
 * @param argv  Executable followed by its arguments (never interpreted by the shell)
 * @return      Exit code and captured output
 * @throws PipelineError(ExternalTool) if the process cannot be started
 */
[[nodiscard]] CommandResult run_command(const std::vector<std::string>& argv);

}  // namespace nxc::external
