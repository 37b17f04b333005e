/**
 * @file    composition_config.hpp
 * @brief   Composition parameters and their permissive field parsers
 * @license MIT
 *
 * @details
 * Every parser here is total: it never throws and maps missing or
 * malformed input to a documented fallback. resolve_config() is the only
 * way the rest of the engine receives a CompositionConfig, so the planner
 * never sees out-of-range values.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace nxc {

enum class OutputFormat {
    Jpeg,
    Png
};

enum class Layout {
    Sheet,      // 800x1000 product card: photo on top, logo band below
    Overlay     // 1200x1200 full-bleed photo
};

enum class WatermarkMode {
    Diagonal,
    Center
};

[[nodiscard]] constexpr std::string_view to_string(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Jpeg: return "jpeg";
        case OutputFormat::Png:  return "png";
        default:                 return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view to_string(Layout layout) noexcept {
    switch (layout) {
        case Layout::Sheet:   return "sheet";
        case Layout::Overlay: return "overlay";
        default:              return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view to_string(WatermarkMode mode) noexcept {
    switch (mode) {
        case WatermarkMode::Diagonal: return "diagonal";
        case WatermarkMode::Center:   return "center";
        default:                      return "unknown";
    }
}

// MIME type of an encoded output
[[nodiscard]] constexpr std::string_view content_type(OutputFormat format) noexcept {
    return format == OutputFormat::Png ? "image/png" : "image/jpeg";
}

/**
 * Fully resolved composition parameters
 */
struct CompositionConfig {
    OutputFormat output_format{OutputFormat::Jpeg};
    int quality{90};                    // 1-100, used by jpeg only
    Layout layout{Layout::Sheet};
    WatermarkMode watermark_mode{WatermarkMode::Diagonal};
    float watermark_opacity{0.30f};     // [0, 1]
    float watermark_scale{2.5f};        // >= 0.1, multiple of canvas width
    float watermark_angle{45.0f};       // degrees, diagonal mode only
};

// Form field names understood by resolve_config()
namespace field {
inline constexpr const char* kFormat           = "format";
inline constexpr const char* kQuality          = "quality";
inline constexpr const char* kLayout           = "layout";
inline constexpr const char* kWatermarkMode    = "watermarkMode";
inline constexpr const char* kWatermarkOpacity = "watermarkOpacity";
inline constexpr const char* kWatermarkScale   = "watermarkScale";
inline constexpr const char* kWatermarkAngle   = "watermarkAngle";
}  // namespace field

inline constexpr int kMinQuality = 1;
inline constexpr int kMaxQuality = 100;
inline constexpr float kMinWatermarkScale = 0.1f;

// "png" (case-insensitive) selects png; anything else, including missing, is jpeg
[[nodiscard]] OutputFormat parse_output_format(std::optional<std::string_view> value) noexcept;

// Leading integer of the value; missing/unparseable/0 -> 90, then clamped to [1, 100]
[[nodiscard]] int parse_quality(std::optional<std::string_view> value) noexcept;

// "overlay" selects overlay; anything else is sheet
[[nodiscard]] Layout parse_layout(std::optional<std::string_view> value) noexcept;

// "center" selects center; anything else is diagonal
[[nodiscard]] WatermarkMode parse_watermark_mode(std::optional<std::string_view> value) noexcept;

// Float clamped to [0, 1]; missing/unparseable/non-finite -> 0.30
[[nodiscard]] float parse_watermark_opacity(std::optional<std::string_view> value) noexcept;

// Float floored at 0.1; missing/unparseable/non-finite -> 2.5
[[nodiscard]] float parse_watermark_scale(std::optional<std::string_view> value) noexcept;

// Any finite float; missing/unparseable/non-finite -> 45
[[nodiscard]] float parse_watermark_angle(std::optional<std::string_view> value) noexcept;

/**
 * Build a valid CompositionConfig from raw form fields
 *
 * @param fields  String-typed request fields (missing keys use defaults)
 * @return        Fully populated configuration
 */
[[nodiscard]] CompositionConfig resolve_config(const FormFields& fields);

/**
 * Look up a form field
 * @return  The value, or std::nullopt when the key is absent
 */
[[nodiscard]] std::optional<std::string_view> find_field(
    const FormFields& fields, const std::string& name);

}  // namespace nxc
