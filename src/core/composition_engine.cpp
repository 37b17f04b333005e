/**
 * @file    composition_engine.cpp
 * @brief   Image composition engine implementation
 * @license MIT
 */

#include "core/composition_engine.hpp"
#include "core/compositor.hpp"
#include "core/image_codec.hpp"
#include "core/layer_renderer.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <chrono>
#include <new>
#include <vector>

namespace nxc {

namespace {

void check_cancelled(const CancelCheck& is_cancelled, const char* stage) {
    if (is_cancelled && is_cancelled()) {
        spdlog::debug("Composition cancelled before {}", stage);
        throw PipelineError(ErrorKind::Cancelled, "Request cancelled");
    }
}

void require_uploads(const ComposeRequest& request) {
    const bool has_subject = request.subject.has_value();
    const bool has_watermark = request.watermark.has_value();

    if (!has_subject && !has_watermark) {
        throw PipelineError(ErrorKind::Validation,
                            fmt::format("Fields \"{}\" and \"{}\" are required",
                                        field::kImage, field::kWatermark));
    }
    if (!has_subject) {
        throw PipelineError(ErrorKind::Validation,
                            fmt::format("Field \"{}\" is required", field::kImage));
    }
    if (!has_watermark) {
        throw PipelineError(ErrorKind::Validation,
                            fmt::format("Field \"{}\" is required", field::kWatermark));
    }
}

// Runs a stage, mapping OpenCV failures to RenderError
template <typename Fn>
auto guarded(const char* stage, Fn&& fn) {
    try {
        return fn();
    } catch (const cv::Exception& e) {
        throw PipelineError(ErrorKind::Render,
                            fmt::format("Image {} failed", stage), e.what());
    }
}

}  // anonymous namespace

ImageResult ImageResult::failure(const PipelineError& error) {
    ImageResult result;
    result.success = false;
    result.error = error.kind();
    result.message = error.what();
    result.detail = error.detail();
    return result;
}

cv::Mat CompositionEngine::render(
    const cv::Mat& subject,
    const cv::Mat& watermark,
    const CompositionConfig& config,
    const CancelCheck& is_cancelled) const
{
    const CanvasPlan plan = plan_canvas(config, subject.size(), watermark.size());

    std::vector<Layer> layers;
    layers.reserve(plan.order.size());

    for (LayerKind kind : plan.order) {
        check_cancelled(is_cancelled, "layer rendering");

        Layer layer;
        switch (kind) {
            case LayerKind::Watermark:
                layer.raster = guarded("resize", [&] { return render_watermark(watermark, plan.watermark); });
                layer.origin = plan.watermark.origin;
                layer.opacity = plan.watermark.opacity;
                break;
            case LayerKind::Subject:
                layer.raster = guarded("resize", [&] { return render_subject(subject, plan.subject); });
                layer.origin = plan.subject.region.tl();
                break;
            case LayerKind::Logo:
                layer.raster = guarded("resize", [&] { return render_logo(watermark, *plan.logo); });
                layer.origin = plan.logo->visible.tl();
                break;
        }

        spdlog::debug("Layer {}: {}x{} at ({},{}) opacity={:.2f}",
                      to_string(kind), layer.raster.cols, layer.raster.rows,
                      layer.origin.x, layer.origin.y, layer.opacity);
        layers.push_back(std::move(layer));
    }

    check_cancelled(is_cancelled, "compositing");
    return guarded("composite", [&] { return composite(plan.canvas, layers); });
}

ImageResult CompositionEngine::compose(
    const ComposeRequest& request,
    const CancelCheck& is_cancelled) const
{
    const auto start_time = std::chrono::steady_clock::now();

    try {
        require_uploads(request);
        const CompositionConfig config = resolve_config(request.fields);

        spdlog::debug("Compose: format={} quality={} layout={} mode={} "
                      "opacity={:.2f} scale={:.2f} angle={:.1f}",
                      to_string(config.output_format), config.quality,
                      to_string(config.layout), to_string(config.watermark_mode),
                      config.watermark_opacity, config.watermark_scale,
                      config.watermark_angle);

        const cv::Mat subject = decode_image(*request.subject, field::kImage);
        const cv::Mat watermark = decode_image(*request.watermark, field::kWatermark);

        const cv::Mat canvas = render(subject, watermark, config, is_cancelled);

        check_cancelled(is_cancelled, "encoding");
        ImageResult result;
        result.data = encode_image(canvas, config.output_format, config.quality);
        result.content_type = std::string(content_type(config.output_format));
        result.success = true;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        spdlog::info("Composed {}x{} {} ({} bytes) in {} ms",
                     canvas.cols, canvas.rows, to_string(config.output_format),
                     result.data.size(), elapsed);
        return result;

    } catch (const PipelineError& e) {
        spdlog::error("Compose failed: {}: {}{}", to_string(e.kind()), e.what(),
                      e.detail().empty() ? "" : fmt::format(" ({})", e.detail()));
        return ImageResult::failure(e);
    } catch (const std::bad_alloc&) {
        spdlog::error("Compose failed: out of memory");
        return ImageResult::failure(PipelineError(ErrorKind::Render, "Out of memory"));
    } catch (const std::exception& e) {
        spdlog::error("Compose failed: {}", e.what());
        return ImageResult::failure(
            PipelineError(ErrorKind::Render, "Error processing the image", e.what()));
    }
}

ImageResult CompositionEngine::convert(
    const std::optional<Bytes>& image,
    const FormFields& fields) const
{
    try {
        if (!image) {
            throw PipelineError(ErrorKind::Validation,
                                fmt::format("Field \"{}\" is required", field::kImage));
        }

        const OutputFormat format = parse_output_format(find_field(fields, field::kFormat));
        const int quality = parse_quality(find_field(fields, field::kQuality));

        const cv::Mat decoded = decode_image(*image, field::kImage);

        // JPEG has no alpha: flatten transparency onto white
        cv::Mat output = decoded;
        if (format == OutputFormat::Jpeg) {
            output = guarded("flatten", [&] {
                return composite(decoded.size(), {Layer{decoded, {0, 0}, 1.0f}});
            });
        }

        ImageResult result;
        result.data = encode_image(output, format, quality);
        result.content_type = std::string(content_type(format));
        result.success = true;

        spdlog::info("Converted {}x{} to {} ({} bytes)",
                     decoded.cols, decoded.rows, to_string(format), result.data.size());
        return result;

    } catch (const PipelineError& e) {
        spdlog::error("Convert failed: {}: {}", to_string(e.kind()), e.what());
        return ImageResult::failure(e);
    } catch (const std::bad_alloc&) {
        spdlog::error("Convert failed: out of memory");
        return ImageResult::failure(PipelineError(ErrorKind::Render, "Out of memory"));
    } catch (const std::exception& e) {
        spdlog::error("Convert failed: {}", e.what());
        return ImageResult::failure(
            PipelineError(ErrorKind::Render, "Error processing the image", e.what()));
    }
}

}  // namespace nxc
