/**
 * @file    layer_renderer.cpp
 * @brief   Per-layer raster transforms implementation
 * @license MIT
 */

#include "core/layer_renderer.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace nxc {

namespace {

// Long side of the downsampled copy used for saliency scoring
constexpr int kSaliencyAnalysisSize = 256;

bool is_opaque(const cv::Mat& bgra) {
    cv::Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    double min_alpha = 0.0;
    cv::minMaxLoc(alpha, &min_alpha);
    return min_alpha >= 255.0;
}

// CV_8UC4 straight alpha -> CV_32FC4 premultiplied [0, 1]
cv::Mat premultiply(const cv::Mat& bgra) {
    cv::Mat f;
    bgra.convertTo(f, CV_32FC4, 1.0 / 255.0);

    std::vector<cv::Mat> ch;
    cv::split(f, ch);
    for (int i = 0; i < 3; ++i) {
        cv::multiply(ch[i], ch[3], ch[i]);
    }
    cv::merge(ch, f);
    return f;
}

// CV_32FC4 premultiplied -> CV_8UC4 straight alpha
cv::Mat unpremultiply(const cv::Mat& premultiplied) {
    std::vector<cv::Mat> ch;
    cv::split(premultiplied, ch);

    cv::Mat safe_alpha = cv::max(ch[3], 1e-6);
    for (int i = 0; i < 3; ++i) {
        cv::divide(ch[i], safe_alpha, ch[i]);
    }

    cv::Mat merged, out;
    cv::merge(ch, merged);
    merged.convertTo(out, CV_8UC4, 255.0);
    return out;
}

int interpolation_for(cv::Size from, cv::Size to) {
    return (to.width > from.width || to.height > from.height)
           ? cv::INTER_LINEAR
           : cv::INTER_AREA;
}

/**
 * Window start with the highest profile sum; ties go to the start closest
 * to the centered position so featureless images crop like "center".
 */
int best_window(const cv::Mat& profile, int window) {
    const int n = static_cast<int>(profile.total());
    if (window >= n) return 0;

    std::vector<double> prefix(n + 1, 0.0);
    const double* values = profile.ptr<double>();
    for (int i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + values[i];
    }

    constexpr double kTolerance = 1e-9;
    const double center = (n - window) / 2.0;
    int best = 0;
    double best_sum = -std::numeric_limits<double>::infinity();

    for (int start = 0; start + window <= n; ++start) {
        const double sum = prefix[start + window] - prefix[start];
        const bool better = sum > best_sum + kTolerance;
        const bool tie_closer = std::abs(sum - best_sum) <= kTolerance &&
                                std::abs(start - center) < std::abs(best - center);
        if (better || tie_closer) {
            best = start;
            best_sum = sum;
        }
    }
    return best;
}

cv::Mat saliency_map(const cv::Mat& bgra) {
    cv::Mat bgr, gray, gray_f;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    gray.convertTo(gray_f, CV_32F, 1.0 / 255.0);

    // Luminance frequency (edge magnitude), normalized to [0, 1]
    cv::Mat gx, gy, edges;
    cv::Sobel(gray_f, gx, CV_32F, 1, 0, 3);
    cv::Sobel(gray_f, gy, CV_32F, 0, 1, 3);
    cv::magnitude(gx, gy, edges);
    double max_edge = 0.0;
    cv::minMaxLoc(edges, nullptr, &max_edge);
    if (max_edge > 0.0) {
        edges /= max_edge;
    }

    // Colour saturation
    cv::Mat hsv, saturation;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
    cv::extractChannel(hsv, saturation, 1);
    saturation.convertTo(saturation, CV_32F, 1.0 / 255.0);

    // Skin tones (classic YCrCb box)
    cv::Mat ycrcb, skin;
    cv::cvtColor(bgr, ycrcb, cv::COLOR_BGR2YCrCb);
    cv::inRange(ycrcb, cv::Scalar(0, 133, 77), cv::Scalar(255, 173, 127), skin);
    skin.convertTo(skin, CV_32F, 1.0 / 255.0);

    // Transparent pixels carry no attention
    cv::Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    alpha.convertTo(alpha, CV_32F, 1.0 / 255.0);

    cv::Mat score = edges + saturation + skin;
    return score.mul(alpha);
}

}  // anonymous namespace

cv::Mat resize_bgra(const cv::Mat& bgra, cv::Size target) {
    CV_Assert(bgra.type() == CV_8UC4);

    if (bgra.size() == target) {
        return bgra.clone();
    }

    const int interpolation = interpolation_for(bgra.size(), target);
    cv::Mat resized;

    if (is_opaque(bgra)) {
        cv::resize(bgra, resized, target, 0, 0, interpolation);
        return resized;
    }

    cv::resize(premultiply(bgra), resized, target, 0, 0, interpolation);
    return unpremultiply(resized);
}

cv::Mat rotate_bgra(const cv::Mat& bgra, double clockwise_deg, cv::Size bounds) {
    CV_Assert(bgra.type() == CV_8UC4);

    // OpenCV angles are counter-clockwise
    const cv::Point2f src_center((bgra.cols - 1) / 2.0f, (bgra.rows - 1) / 2.0f);
    cv::Mat m = cv::getRotationMatrix2D(src_center, -clockwise_deg, 1.0);

    // Shift so the source center lands on the center of the expanded box
    m.at<double>(0, 2) += (bounds.width - 1) / 2.0 - src_center.x;
    m.at<double>(1, 2) += (bounds.height - 1) / 2.0 - src_center.y;

    cv::Mat rotated;
    cv::warpAffine(premultiply(bgra), rotated, m, bounds,
                   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
    return unpremultiply(rotated);
}

cv::Rect find_salient_crop(const cv::Mat& bgra, cv::Size target) {
    CV_Assert(bgra.type() == CV_8UC4);
    CV_Assert(bgra.cols >= target.width && bgra.rows >= target.height);

    const int excess_x = bgra.cols - target.width;
    const int excess_y = bgra.rows - target.height;
    if (excess_x == 0 && excess_y == 0) {
        return cv::Rect(cv::Point(0, 0), target);
    }

    // Score a downsampled copy; the window search is 1-D per axis
    const double factor = std::min(
        1.0, static_cast<double>(kSaliencyAnalysisSize) / std::max(bgra.cols, bgra.rows));
    cv::Mat analysis = bgra;
    if (factor < 1.0) {
        const cv::Size small(std::max(1, static_cast<int>(std::lround(bgra.cols * factor))),
                             std::max(1, static_cast<int>(std::lround(bgra.rows * factor))));
        cv::resize(bgra, analysis, small, 0, 0, cv::INTER_AREA);
    }
    const cv::Mat score = saliency_map(analysis);

    auto locate = [&](int dim, int full, int wanted, int excess) {
        if (excess == 0) return 0;
        cv::Mat profile;
        cv::reduce(score, profile, dim, cv::REDUCE_SUM, CV_64F);
        const int window = std::max(1, static_cast<int>(std::lround(wanted * factor)));
        const int start = best_window(profile, window);
        const int offset = static_cast<int>(std::lround(start / factor));
        return std::clamp(offset, 0, full - wanted);
    };

    // dim 0 collapses rows (column profile), dim 1 collapses columns
    const int x = locate(0, bgra.cols, target.width, excess_x);
    const int y = locate(1, bgra.rows, target.height, excess_y);

    spdlog::debug("Salient crop: {}x{} -> {}x{} at ({},{})",
                  bgra.cols, bgra.rows, target.width, target.height, x, y);
    return cv::Rect(x, y, target.width, target.height);
}

cv::Mat render_subject(const cv::Mat& bgra, const SubjectPlan& plan) {
    // Crop in source pixels so only the visible region is ever resampled
    const cv::Size target = plan.region.size();
    const cv::Rect crop = find_salient_crop(bgra, plan.source_crop);
    return resize_bgra(bgra(crop), target);
}

cv::Mat render_watermark(const cv::Mat& bgra, const WatermarkPlan& plan) {
    cv::Mat scaled = resize_bgra(bgra, plan.scaled);
    if (plan.rotation == 0.0) {
        return scaled;
    }
    return rotate_bgra(scaled, plan.rotation, plan.bounds);
}

cv::Mat render_logo(const cv::Mat& bgra, const LogoPlan& plan) {
    if (plan.visible == plan.rect) {
        return resize_bgra(bgra, plan.rect.size());
    }
    CV_Assert(!plan.visible.empty());

    // Map the visible part of the placed logo back to source pixels
    const double fx = static_cast<double>(bgra.cols) / plan.rect.width;
    const double fy = static_cast<double>(bgra.rows) / plan.rect.height;
    const cv::Point offset = plan.visible.tl() - plan.rect.tl();

    const int x0 = std::clamp(static_cast<int>(std::floor(offset.x * fx)), 0, bgra.cols - 1);
    const int y0 = std::clamp(static_cast<int>(std::floor(offset.y * fy)), 0, bgra.rows - 1);
    const int x1 = std::clamp(static_cast<int>(std::ceil((offset.x + plan.visible.width) * fx)),
                              x0 + 1, bgra.cols);
    const int y1 = std::clamp(static_cast<int>(std::ceil((offset.y + plan.visible.height) * fy)),
                              y0 + 1, bgra.rows);

    return resize_bgra(bgra(cv::Rect(x0, y0, x1 - x0, y1 - y0)), plan.visible.size());
}

}  // namespace nxc
