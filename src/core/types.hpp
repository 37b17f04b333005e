/**
 * @file    types.hpp
 * @brief   Shared type definitions for NexusConverter
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nxc {

// Version info
#ifdef NXC_APP_VERSION
inline constexpr const char* kVersion = NXC_APP_VERSION;
#else
inline constexpr const char* kVersion = "3.1.0";
#endif

// Encoded byte buffer (uploaded file content or encoded output)
using Bytes = std::vector<unsigned char>;

// Flat key/value record as it arrives from multipart form fields
using FormFields = std::unordered_map<std::string, std::string>;

// Error category reported across the engine boundary
enum class ErrorKind {
    None,
    Validation,
    Decode,
    Render,
    ExternalTool,
    Cancelled
};

// Convert error kind to string
[[nodiscard]] constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:         return "None";
        case ErrorKind::Validation:   return "ValidationError";
        case ErrorKind::Decode:       return "DecodeError";
        case ErrorKind::Render:       return "RenderError";
        case ErrorKind::ExternalTool: return "ExternalToolError";
        case ErrorKind::Cancelled:    return "Cancelled";
        default:                      return "Unknown";
    }
}

/**
 * Error raised inside the pipeline and the external tool adapters.
 *
 * what() is the user-facing message; detail() carries the underlying
 * library or tool output when it helps debugging.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message, std::string detail = {})
        : std::runtime_error(message)
        , kind_(kind)
        , detail_(std::move(detail)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

}  // namespace nxc
