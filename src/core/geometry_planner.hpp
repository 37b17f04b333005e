/**
 * @file    geometry_planner.hpp
 * @brief   Canvas and layer geometry for product-sheet composition
 * @license MIT
 *
 * @details
 * Pure geometry: given a resolved config and the natural sizes of the two
 * source images, computes the canvas size, each layer's target size and
 * placement, and the paint order. No pixels are touched here.
 *
 *   Sheet   (800x1000):  subject in the top 800x800, 400-wide logo
 *                        centered in the bottom 200 band.
 *   Overlay (1200x1200): subject covers the whole canvas.
 *
 * The watermark is always centered on the canvas and may extend past it
 * (scale > 1); the compositor clips.
 */

#pragma once

#include "core/composition_config.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace nxc {

// Fixed layout constants
inline constexpr int kSheetWidth = 800;
inline constexpr int kSheetHeight = 1000;
inline constexpr int kSheetSubjectHeight = 800;
inline constexpr int kSheetLogoWidth = 400;
inline constexpr int kOverlaySize = 1200;

enum class LayerKind {
    Watermark,
    Subject,
    Logo
};

[[nodiscard]] constexpr std::string_view to_string(LayerKind kind) noexcept {
    switch (kind) {
        case LayerKind::Watermark: return "watermark";
        case LayerKind::Subject:   return "subject";
        case LayerKind::Logo:      return "logo";
        default:                   return "unknown";
    }
}

/**
 * Subject layer: cover-fit into region, cropped around the salient area
 */
struct SubjectPlan {
    cv::Rect region;        // Target region on the canvas
    cv::Size scaled;        // Cover-scaled size (>= region size)
    cv::Size source_crop;   // Source pixels that map onto region after scaling
};

/**
 * Watermark layer: inside-fit, optional rotation, centered on the canvas
 */
struct WatermarkPlan {
    cv::Size scaled;        // Size after resize, before rotation
    double rotation{0.0};   // Clockwise degrees in [0, 360); 0 = no rotation
    cv::Size bounds;        // Bounding box after rotation (== scaled when unrotated)
    cv::Point origin;       // Top-left of bounds on the canvas (may be negative)
    float opacity{1.0f};
};

/**
 * Secondary logo layer (sheet layout only)
 */
struct LogoPlan {
    cv::Rect rect;          // Size and top-left on the canvas
    cv::Rect visible;       // Part of rect inside the canvas
};

/**
 * Complete per-request layout
 */
struct CanvasPlan {
    cv::Size canvas;
    SubjectPlan subject;
    WatermarkPlan watermark;
    std::optional<LogoPlan> logo;
    std::vector<LayerKind> order;   // Bottom to top
};

/**
 * Compute the canvas plan
 *
 * @param config          Resolved composition config
 * @param subject_size    Natural size of the subject image (non-empty)
 * @param watermark_size  Natural size of the watermark image (non-empty)
 * @return                Deterministic layout for this request
 * @throws PipelineError(Validation) if either size is empty
 */
[[nodiscard]] CanvasPlan plan_canvas(
    const CompositionConfig& config,
    cv::Size subject_size,
    cv::Size watermark_size
);

// Size that covers target while preserving aspect ratio (each side >= target)
[[nodiscard]] cv::Size cover_size(cv::Size natural, cv::Size target);

// Source extent that cover-scales onto exactly target (clamped to natural)
[[nodiscard]] cv::Size source_crop_size(cv::Size natural, cv::Size scaled, cv::Size target);

// Aspect-preserving size for a requested width, never wider than natural
[[nodiscard]] cv::Size inside_width(cv::Size natural, int requested_width);

// Aspect-preserving size with exactly the requested width
[[nodiscard]] cv::Size fixed_width(cv::Size natural, int width);

// Axis-aligned bounding box of a size rotated by angle degrees
[[nodiscard]] cv::Size rotated_bounds(cv::Size size, double angle_degrees);

// Normalize degrees into [0, 360)
[[nodiscard]] double normalize_angle(double angle_degrees) noexcept;

}  // namespace nxc
