/**
 * @file    compositor.hpp
 * @brief   Layer stacking onto an opaque canvas
 * @license MIT
 *
 * @details
 * Source-over blending with a per-layer opacity multiplier:
 *   a      = layer_alpha * opacity
 *   result = a * layer + (1 - a) * canvas
 * The canvas starts opaque, so the flattened result is always opaque.
 */

#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace nxc {

/**
 * A rendered raster with its placement
 */
struct Layer {
    cv::Mat raster;             // CV_8UC4 straight alpha
    cv::Point origin{0, 0};     // Top-left on the canvas (may be negative)
    float opacity{1.0f};        // [0, 1], applied at composite time
};

// Opaque white
inline const cv::Scalar kWhiteBackground(255, 255, 255);

/**
 * Blend one layer onto a canvas in place
 *
 * Parts of the layer outside the canvas are clipped.
 *
 * @param canvas  CV_8UC3 canvas
 * @param layer   Layer to paint
 */
void blend_layer(cv::Mat& canvas, const Layer& layer);

/**
 * Flatten an ordered layer list (bottom to top)
 *
 * @param size        Canvas size
 * @param layers      Layers in paint order
 * @param background  Canvas fill colour (BGR)
 * @return            CV_8UC3 raster of exactly the requested size
 */
[[nodiscard]] cv::Mat composite(
    cv::Size size,
    const std::vector<Layer>& layers,
    const cv::Scalar& background = kWhiteBackground
);

}  // namespace nxc
