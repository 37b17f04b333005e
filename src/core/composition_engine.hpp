/**
 * @file    composition_engine.hpp
 * @brief   Image composition engine (product sheet / overlay)
 * @license MIT
 *
 * @details
 * Pipeline per request:
 *   resolve config -> decode -> plan -> render layers -> composite -> encode
 *
 * The engine holds no mutable state; one instance can serve any number of
 * concurrent requests. Errors never escape compose()/convert(): they come
 * back as a failed ImageResult with a stable ErrorKind.
 */

#pragma once

#include "core/composition_config.hpp"
#include "core/geometry_planner.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <functional>
#include <optional>
#include <string>

namespace nxc {

// Upload field names
namespace field {
inline constexpr const char* kImage     = "image";
inline constexpr const char* kWatermark = "watermark";
}  // namespace field

// Returns true once the caller no longer wants the result
using CancelCheck = std::function<bool()>;

/**
 * Inputs of a composition request
 */
struct ComposeRequest {
    std::optional<Bytes> subject;       // "image" upload
    std::optional<Bytes> watermark;     // "watermark" upload
    FormFields fields;                  // Raw config fields
};

/**
 * Tagged result of an engine call
 */
struct ImageResult {
    bool success{false};
    ErrorKind error{ErrorKind::None};
    std::string message;        // Human-readable, safe to show to clients
    std::string detail;         // Underlying library message (may be empty)
    Bytes data;                 // Encoded output on success
    std::string content_type;   // "image/jpeg" or "image/png" on success

    [[nodiscard]] static ImageResult failure(const PipelineError& error);
};

class CompositionEngine {
public:
    /**
     * Compose subject and watermark into a product image
     *
     * @param request       Uploads and raw config fields
     * @param is_cancelled  Optional abort predicate, checked between stages
     * @return              Encoded image or a categorized failure
     */
    [[nodiscard]] ImageResult compose(
        const ComposeRequest& request,
        const CancelCheck& is_cancelled = {}
    ) const;

    /**
     * Plain format conversion (no watermark)
     *
     * Uses the "format" and "quality" fields with the same permissive
     * rules as compose().
     */
    [[nodiscard]] ImageResult convert(
        const std::optional<Bytes>& image,
        const FormFields& fields
    ) const;

    /**
     * Build the flattened raster for already decoded inputs
     *
     * @param subject    CV_8UC4 subject
     * @param watermark  CV_8UC4 watermark / logo
     * @param config     Resolved config
     * @return           CV_8UC3 canvas of the layout's size
     */
    [[nodiscard]] cv::Mat render(
        const cv::Mat& subject,
        const cv::Mat& watermark,
        const CompositionConfig& config,
        const CancelCheck& is_cancelled = {}
    ) const;
};

}  // namespace nxc
