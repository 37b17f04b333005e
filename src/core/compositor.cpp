/**
 * @file    compositor.cpp
 * @brief   Layer stacking implementation
 * @license MIT
 */

#include "core/compositor.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace nxc {

void blend_layer(cv::Mat& canvas, const Layer& layer) {
    CV_Assert(canvas.type() == CV_8UC3);
    CV_Assert(layer.raster.type() == CV_8UC4);

    const float opacity = std::clamp(layer.opacity, 0.0f, 1.0f);
    if (opacity <= 0.0f || layer.raster.empty()) {
        return;
    }

    // Calculate ROI (clamp to canvas bounds)
    const cv::Point pos = layer.origin;
    const int x1 = std::max(0, pos.x);
    const int y1 = std::max(0, pos.y);
    const int x2 = std::min(canvas.cols, pos.x + layer.raster.cols);
    const int y2 = std::min(canvas.rows, pos.y + layer.raster.rows);

    if (x1 >= x2 || y1 >= y2) {
        spdlog::debug("Layer at ({},{}) {}x{} is outside the canvas",
                      pos.x, pos.y, layer.raster.cols, layer.raster.rows);
        return;
    }

    constexpr float kInv255 = 1.0f / 255.0f;

    for (int y = y1; y < y2; ++y) {
        auto* dst = canvas.ptr<cv::Vec3b>(y);
        const auto* src = layer.raster.ptr<cv::Vec4b>(y - pos.y);

        for (int x = x1; x < x2; ++x) {
            const cv::Vec4b& s = src[x - pos.x];
            const float a = s[3] * kInv255 * opacity;
            if (a <= 0.0f) continue;

            cv::Vec3b& d = dst[x];
            for (int c = 0; c < 3; ++c) {
                const float blended = a * s[c] + (1.0f - a) * d[c];
                d[c] = cv::saturate_cast<uchar>(blended);
            }
        }
    }
}

cv::Mat composite(
    cv::Size size,
    const std::vector<Layer>& layers,
    const cv::Scalar& background)
{
    if (size.width <= 0 || size.height <= 0) {
        throw PipelineError(ErrorKind::Render, "Canvas size must be positive");
    }

    cv::Mat canvas(size, CV_8UC3, background);

    for (const Layer& layer : layers) {
        blend_layer(canvas, layer);
    }

    spdlog::debug("Composited {} layers onto {}x{} canvas",
                  layers.size(), size.width, size.height);
    return canvas;
}

}  // namespace nxc
