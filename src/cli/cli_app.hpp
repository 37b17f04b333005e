/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @license MIT
 */

#pragma once

#include "core/composition_config.hpp"

#include <filesystem>

namespace nxc::cli {

/**
 * Run the CLI application
 *
 * Subcommands:
 *   serve    Start the HTTP conversion gateway
 *   compose  Compose one product image from local files
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success)
 */
int run(int argc, char** argv);

/**
 * Output format implied by a file name (".png" -> Png, anything else -> Jpeg)
 */
[[nodiscard]] OutputFormat format_from_extension(const std::filesystem::path& path);

}  // namespace nxc::cli
