/**
 * @file    geometry_planner_test.cpp
 * @brief   Unit tests for canvas and layer geometry
 */

#include <gtest/gtest.h>
#include "core/geometry_planner.hpp"

#include <cmath>
#include <limits>

using namespace nxc;

namespace {

CompositionConfig config_for(Layout layout, WatermarkMode mode, float scale) {
    CompositionConfig config;
    config.layout = layout;
    config.watermark_mode = mode;
    config.watermark_scale = scale;
    config.watermark_opacity = 1.0f;
    return config;
}

}  // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

TEST(CoverSizeTest, CoversTargetPreservingAspect) {
    EXPECT_EQ(cover_size({1000, 1000}, {800, 800}), cv::Size(800, 800));
    EXPECT_EQ(cover_size({1000, 500}, {800, 800}), cv::Size(1600, 800));
    EXPECT_EQ(cover_size({300, 600}, {1200, 1200}), cv::Size(1200, 2400));
}

TEST(InsideWidthTest, NeverEnlarges) {
    EXPECT_EQ(inside_width({500, 500}, 800), cv::Size(500, 500));
    EXPECT_EQ(inside_width({500, 250}, 2000), cv::Size(500, 250));
    EXPECT_EQ(inside_width({1000, 500}, 400), cv::Size(400, 200));
}

TEST(FixedWidthTest, ScalesBothWays) {
    EXPECT_EQ(fixed_width({200, 100}, 400), cv::Size(400, 200));
    EXPECT_EQ(fixed_width({800, 200}, 400), cv::Size(400, 100));
}

TEST(SourceCropSizeTest, MatchesTargetAspectInSourcePixels) {
    EXPECT_EQ(source_crop_size({1000, 1000}, {800, 800}, {800, 800}), cv::Size(1000, 1000));
    EXPECT_EQ(source_crop_size({1000, 500}, {1600, 800}, {800, 800}), cv::Size(500, 500));
    EXPECT_EQ(source_crop_size({1, 3000}, {800, 2400000}, {800, 800}), cv::Size(1, 1));
}

TEST(NormalizeAngleTest, WrapsIntoOneTurn) {
    EXPECT_DOUBLE_EQ(normalize_angle(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalize_angle(360.0), 0.0);
    EXPECT_DOUBLE_EQ(normalize_angle(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(normalize_angle(765.0), 45.0);
}

TEST(RotatedBoundsTest, RightAnglesAreExact) {
    EXPECT_EQ(rotated_bounds({100, 50}, 0.0), cv::Size(100, 50));
    EXPECT_EQ(rotated_bounds({100, 50}, 90.0), cv::Size(50, 100));
    EXPECT_EQ(rotated_bounds({100, 50}, 180.0), cv::Size(100, 50));
    EXPECT_EQ(rotated_bounds({100, 50}, -90.0), cv::Size(50, 100));
}

TEST(RotatedBoundsTest, DiagonalExpands) {
    // (100 + 50) * sqrt(2) / 2 = 106.07
    EXPECT_EQ(rotated_bounds({100, 50}, 45.0), cv::Size(107, 107));
}

// ─────────────────────────────────────────────────────────────────────────────
// plan_canvas
// ─────────────────────────────────────────────────────────────────────────────

TEST(PlanCanvasTest, SheetCenterScenario) {
    const CanvasPlan plan = plan_canvas(
        config_for(Layout::Sheet, WatermarkMode::Center, 1.0f), {1000, 1000}, {500, 500});

    EXPECT_EQ(plan.canvas, cv::Size(800, 1000));
    EXPECT_EQ(plan.subject.region, cv::Rect(0, 0, 800, 800));
    EXPECT_EQ(plan.subject.scaled, cv::Size(800, 800));

    EXPECT_EQ(plan.watermark.scaled, cv::Size(500, 500));
    EXPECT_DOUBLE_EQ(plan.watermark.rotation, 0.0);
    EXPECT_EQ(plan.watermark.bounds, cv::Size(500, 500));
    EXPECT_EQ(plan.watermark.origin, cv::Point(150, 250));
    EXPECT_FLOAT_EQ(plan.watermark.opacity, 1.0f);

    ASSERT_TRUE(plan.logo.has_value());
    EXPECT_EQ(plan.logo->rect, cv::Rect(200, 700, 400, 400));
    EXPECT_EQ(plan.logo->visible, cv::Rect(200, 700, 400, 300));

    const std::vector<LayerKind> expected = {
        LayerKind::Watermark, LayerKind::Subject, LayerKind::Logo};
    EXPECT_EQ(plan.order, expected);
}

TEST(PlanCanvasTest, WideLogoIsCenteredInBand) {
    const CanvasPlan plan = plan_canvas(
        config_for(Layout::Sheet, WatermarkMode::Center, 1.0f), {640, 480}, {800, 200});

    ASSERT_TRUE(plan.logo.has_value());
    // 400x100 logo, band is y 800..1000
    EXPECT_EQ(plan.logo->rect, cv::Rect(200, 850, 400, 100));
    EXPECT_EQ(plan.logo->visible, plan.logo->rect);
}

TEST(PlanCanvasTest, ThinSourcesStayBoundedOnCanvas) {
    const CanvasPlan plan = plan_canvas(
        config_for(Layout::Sheet, WatermarkMode::Diagonal, 2.5f), {1, 4000}, {1, 4000});

    EXPECT_EQ(plan.subject.source_crop, cv::Size(1, 1));
    EXPECT_EQ(plan.watermark.scaled, cv::Size(1, 4000));

    ASSERT_TRUE(plan.logo.has_value());
    EXPECT_EQ(plan.logo->rect.size(), cv::Size(400, 1600000));
    EXPECT_EQ(plan.logo->visible, cv::Rect(200, 0, 400, 1000));
}

TEST(PlanCanvasTest, OverlayHasNoLogo) {
    const CanvasPlan plan = plan_canvas(
        config_for(Layout::Overlay, WatermarkMode::Center, 0.5f), {640, 480}, {1000, 1000});

    EXPECT_EQ(plan.canvas, cv::Size(1200, 1200));
    EXPECT_EQ(plan.subject.region, cv::Rect(0, 0, 1200, 1200));
    EXPECT_EQ(plan.subject.scaled, cv::Size(1600, 1200));
    EXPECT_EQ(plan.subject.source_crop, cv::Size(480, 480));
    EXPECT_EQ(plan.watermark.scaled, cv::Size(600, 600));
    EXPECT_EQ(plan.watermark.origin, cv::Point(300, 300));
    EXPECT_FALSE(plan.logo.has_value());

    const std::vector<LayerKind> expected = {LayerKind::Watermark, LayerKind::Subject};
    EXPECT_EQ(plan.order, expected);
}

TEST(PlanCanvasTest, WatermarkWidthFollowsScale) {
    for (float scale : {0.1f, 0.25f, 0.5f, 0.75f, 1.0f}) {
        const CanvasPlan plan = plan_canvas(
            config_for(Layout::Sheet, WatermarkMode::Center, scale), {800, 800}, {4000, 2000});
        EXPECT_EQ(plan.watermark.scaled.width, static_cast<int>(std::lround(800 * scale)))
            << "scale " << scale;
        EXPECT_EQ(plan.watermark.scaled.height * 2, plan.watermark.scaled.width)
            << "scale " << scale;
    }
}

TEST(PlanCanvasTest, HugeScaleKeepsNaturalWidth) {
    const CanvasPlan plan = plan_canvas(
        config_for(Layout::Sheet, WatermarkMode::Center, std::numeric_limits<float>::max()),
        {800, 800}, {300, 150});
    EXPECT_EQ(plan.watermark.scaled, cv::Size(300, 150));
}

TEST(PlanCanvasTest, DiagonalRotatesAndRecenters) {
    CompositionConfig config = config_for(Layout::Sheet, WatermarkMode::Diagonal, 2.5f);
    config.watermark_angle = 45.0f;

    const CanvasPlan plan = plan_canvas(config, {800, 800}, {3000, 3000});

    EXPECT_EQ(plan.watermark.scaled, cv::Size(2000, 2000));
    EXPECT_DOUBLE_EQ(plan.watermark.rotation, 45.0);
    EXPECT_EQ(plan.watermark.bounds, cv::Size(2829, 2829));
    // Larger than the canvas: negative, floored offsets
    EXPECT_EQ(plan.watermark.origin, cv::Point(-1015, -915));
}

TEST(PlanCanvasTest, CenterModeIgnoresAngle) {
    CompositionConfig config = config_for(Layout::Sheet, WatermarkMode::Center, 0.5f);
    config.watermark_angle = 30.0f;

    const CanvasPlan plan = plan_canvas(config, {800, 800}, {400, 200});
    EXPECT_DOUBLE_EQ(plan.watermark.rotation, 0.0);
    EXPECT_EQ(plan.watermark.bounds, plan.watermark.scaled);
}

TEST(PlanCanvasTest, ZeroAngleSkipsRotation) {
    CompositionConfig config = config_for(Layout::Overlay, WatermarkMode::Diagonal, 0.5f);
    config.watermark_angle = 360.0f;

    const CanvasPlan plan = plan_canvas(config, {800, 800}, {400, 200});
    EXPECT_DOUBLE_EQ(plan.watermark.rotation, 0.0);
    EXPECT_EQ(plan.watermark.bounds, cv::Size(400, 200));
}

TEST(PlanCanvasTest, NegativeAngleIsNormalized) {
    CompositionConfig config = config_for(Layout::Overlay, WatermarkMode::Diagonal, 0.5f);
    config.watermark_angle = -90.0f;

    const CanvasPlan plan = plan_canvas(config, {800, 800}, {400, 200});
    EXPECT_DOUBLE_EQ(plan.watermark.rotation, 270.0);
    EXPECT_EQ(plan.watermark.bounds, cv::Size(200, 400));
}

TEST(PlanCanvasTest, IsDeterministic) {
    const CompositionConfig config;
    const CanvasPlan a = plan_canvas(config, {1234, 567}, {890, 123});
    const CanvasPlan b = plan_canvas(config, {1234, 567}, {890, 123});

    EXPECT_EQ(a.canvas, b.canvas);
    EXPECT_EQ(a.subject.scaled, b.subject.scaled);
    EXPECT_EQ(a.watermark.bounds, b.watermark.bounds);
    EXPECT_EQ(a.watermark.origin, b.watermark.origin);
    EXPECT_EQ(a.logo->rect, b.logo->rect);
}

TEST(PlanCanvasTest, EmptySizesAreRejected) {
    const CompositionConfig config;
    try {
        (void)plan_canvas(config, {0, 10}, {10, 10});
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
    EXPECT_THROW((void)plan_canvas(config, {10, 10}, {10, 0}), PipelineError);
}
