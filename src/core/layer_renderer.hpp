/**
 * @file    layer_renderer.hpp
 * @brief   Per-layer raster transforms (resize, crop, rotate)
 * @license MIT
 *
 * @details
 * All inputs and outputs are CV_8UC4 (straight alpha). Resampling runs on
 * premultiplied float data so transparent pixels never bleed dark fringes
 * into edges. Opacity is NOT applied here; the compositor applies it per
 * layer at paint time, so a rendered buffer can be reused at any opacity.
 */

#pragma once

#include "core/geometry_planner.hpp"

#include <opencv2/core.hpp>

namespace nxc {

/**
 * Render the subject: pick the most salient source_crop window of the
 * source, then resize it to the region size.
 */
[[nodiscard]] cv::Mat render_subject(const cv::Mat& bgra, const SubjectPlan& plan);

/**
 * Render the watermark: inside-resize, then rotate clockwise into the
 * expanded bounding box with fully transparent corners.
 */
[[nodiscard]] cv::Mat render_watermark(const cv::Mat& bgra, const WatermarkPlan& plan);

/**
 * Render the part of the secondary logo that lands on the canvas
 *
 * The result has the size of plan.visible and is placed at its top-left.
 */
[[nodiscard]] cv::Mat render_logo(const cv::Mat& bgra, const LogoPlan& plan);

/**
 * Alpha-correct resize
 *
 * Uses INTER_AREA for downscaling and INTER_LINEAR for upscaling.
 */
[[nodiscard]] cv::Mat resize_bgra(const cv::Mat& bgra, cv::Size target);

/**
 * Alpha-correct rotation around the image center
 *
 * @param bgra           Source raster
 * @param clockwise_deg  Clockwise angle in degrees
 * @param bounds         Output size (usually rotated_bounds() of the source)
 * @return               Rotated raster; uncovered area is transparent
 */
[[nodiscard]] cv::Mat rotate_bgra(const cv::Mat& bgra, double clockwise_deg, cv::Size bounds);

/**
 * Attention-based crop window
 *
 * Scores each pixel by edge strength (luminance gradient), colour
 * saturation and skin-tone likelihood, weighted by alpha, then slides a
 * target-sized window along the axes with excess and keeps the window with
 * the highest total score. Ties resolve toward the centered window.
 *
 * @param bgra    Image at least as large as target on both axes
 * @param target  Crop size
 * @return        Crop rectangle inside the image
 */
[[nodiscard]] cv::Rect find_salient_crop(const cv::Mat& bgra, cv::Size target);

}  // namespace nxc
