/**
 * @file    server_config.hpp
 * @brief   Gateway runtime configuration
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace nxc::server {

struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{3000};
    std::size_t threads{2};                 // HTTP worker threads (>= 2)
    std::filesystem::path tmp_dir;          // Scratch space for external tools
    std::size_t max_upload_mb{500};         // Request body ceiling

    // External tool executables (looked up in PATH when not absolute)
    std::string ffmpeg{"ffmpeg"};
    std::string soffice{"soffice"};
    std::string ytdlp{"yt-dlp"};
};

}  // namespace nxc::server
