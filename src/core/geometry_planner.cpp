/**
 * @file    geometry_planner.cpp
 * @brief   Canvas and layer geometry implementation
 * @license MIT
 */

#include "core/geometry_planner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace nxc {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Centering offset that floors for negative slack (layer larger than canvas)
int centered(int outer, int inner) {
    return static_cast<int>(std::floor((outer - inner) / 2.0));
}

int scaled_extent(int extent, double factor) {
    return std::max(1, static_cast<int>(std::lround(extent * factor)));
}

}  // anonymous namespace

cv::Size cover_size(cv::Size natural, cv::Size target) {
    const double scale = std::max(
        static_cast<double>(target.width) / natural.width,
        static_cast<double>(target.height) / natural.height
    );
    return cv::Size(
        std::max(target.width, scaled_extent(natural.width, scale)),
        std::max(target.height, scaled_extent(natural.height, scale))
    );
}

cv::Size source_crop_size(cv::Size natural, cv::Size scaled, cv::Size target) {
    auto extent = [](int src, int dst, int wanted) {
        const double mapped = static_cast<double>(wanted) * src / dst;
        return std::clamp(static_cast<int>(std::lround(mapped)), 1, src);
    };
    return cv::Size(extent(natural.width, scaled.width, target.width),
                    extent(natural.height, scaled.height, target.height));
}

cv::Size inside_width(cv::Size natural, int requested_width) {
    const int width = std::clamp(requested_width, 1, natural.width);
    return fixed_width(natural, width);
}

cv::Size fixed_width(cv::Size natural, int width) {
    const double factor = static_cast<double>(width) / natural.width;
    return cv::Size(width, scaled_extent(natural.height, factor));
}

double normalize_angle(double angle_degrees) noexcept {
    double angle = std::fmod(angle_degrees, 360.0);
    if (angle < 0.0) {
        angle += 360.0;
    }
    // fmod of a tiny negative value can round up to exactly 360
    return angle >= 360.0 ? 0.0 : angle;
}

cv::Size rotated_bounds(cv::Size size, double angle_degrees) {
    const double radians = normalize_angle(angle_degrees) * kPi / 180.0;
    const double c = std::abs(std::cos(radians));
    const double s = std::abs(std::sin(radians));

    // Small epsilon keeps exact right angles from growing by a pixel
    constexpr double kEpsilon = 1e-6;
    const double w = size.width * c + size.height * s;
    const double h = size.width * s + size.height * c;
    return cv::Size(
        std::max(1, static_cast<int>(std::ceil(w - kEpsilon))),
        std::max(1, static_cast<int>(std::ceil(h - kEpsilon)))
    );
}

CanvasPlan plan_canvas(
    const CompositionConfig& config,
    cv::Size subject_size,
    cv::Size watermark_size)
{
    if (subject_size.width <= 0 || subject_size.height <= 0) {
        throw PipelineError(ErrorKind::Validation, "Subject image has no pixels");
    }
    if (watermark_size.width <= 0 || watermark_size.height <= 0) {
        throw PipelineError(ErrorKind::Validation, "Watermark image has no pixels");
    }

    CanvasPlan plan;

    // Canvas and subject region
    if (config.layout == Layout::Sheet) {
        plan.canvas = cv::Size(kSheetWidth, kSheetHeight);
        plan.subject.region = cv::Rect(0, 0, kSheetWidth, kSheetSubjectHeight);
    } else {
        plan.canvas = cv::Size(kOverlaySize, kOverlaySize);
        plan.subject.region = cv::Rect(0, 0, kOverlaySize, kOverlaySize);
    }
    plan.subject.scaled = cover_size(subject_size, plan.subject.region.size());
    plan.subject.source_crop = source_crop_size(
        subject_size, plan.subject.scaled, plan.subject.region.size());

    // Watermark: width follows the canvas, inside fit never enlarges
    // Clamp before rounding; scale may be as large as FLT_MAX
    const double wanted = std::min(
        static_cast<double>(plan.canvas.width) * config.watermark_scale,
        static_cast<double>(watermark_size.width));
    const int requested = static_cast<int>(std::lround(std::max(wanted, 1.0)));
    WatermarkPlan& wm = plan.watermark;
    wm.scaled = inside_width(watermark_size, requested);
    wm.rotation = (config.watermark_mode == WatermarkMode::Diagonal)
                  ? normalize_angle(config.watermark_angle)
                  : 0.0;
    wm.bounds = (wm.rotation != 0.0) ? rotated_bounds(wm.scaled, wm.rotation) : wm.scaled;
    wm.origin = cv::Point(
        centered(plan.canvas.width, wm.bounds.width),
        centered(plan.canvas.height, wm.bounds.height)
    );
    wm.opacity = config.watermark_opacity;

    plan.order = {LayerKind::Watermark, LayerKind::Subject};

    // Secondary logo in the band below the subject
    if (config.layout == Layout::Sheet) {
        const cv::Size logo_size = fixed_width(watermark_size, kSheetLogoWidth);
        const int band_top = plan.subject.region.y + plan.subject.region.height;
        const int band_height = plan.canvas.height - band_top;

        LogoPlan logo;
        logo.rect = cv::Rect(
            cv::Point(centered(plan.canvas.width, logo_size.width),
                      band_top + centered(band_height, logo_size.height)),
            logo_size
        );
        logo.visible = logo.rect & cv::Rect(cv::Point(0, 0), plan.canvas);
        plan.logo = logo;
        plan.order.push_back(LayerKind::Logo);
    }

    spdlog::debug("Plan: canvas {}x{} ({}), subject {}x{} -> {}x{}, "
                  "watermark {}x{} rot={:.1f} bounds {}x{} at ({},{}) opacity={:.2f}",
                  plan.canvas.width, plan.canvas.height, to_string(config.layout),
                  subject_size.width, subject_size.height,
                  plan.subject.scaled.width, plan.subject.scaled.height,
                  wm.scaled.width, wm.scaled.height, wm.rotation,
                  wm.bounds.width, wm.bounds.height, wm.origin.x, wm.origin.y,
                  wm.opacity);

    return plan;
}

}  // namespace nxc
