/**
 * @file    image_codec.hpp
 * @brief   In-memory image decode/encode
 * @license MIT
 */

#pragma once

#include "core/composition_config.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <string_view>

namespace nxc {

/**
 * Decode an encoded image buffer to 8-bit BGRA
 *
 * Gray, BGR and 16-bit inputs are normalized so every layer carries an
 * alpha channel through resize and rotation.
 *
 * @param bytes  Encoded image (any format OpenCV can read)
 * @param name   Field name used in the error message
 * @return       CV_8UC4 image
 * @throws PipelineError(Decode) if the buffer is not a decodable image
 */
[[nodiscard]] cv::Mat decode_image(const Bytes& bytes, std::string_view name);

/**
 * Encode a flattened raster
 *
 * @param image    CV_8UC3 or CV_8UC4 raster
 * @param format   Target format
 * @param quality  JPEG quality 1-100 (ignored for png)
 * @return         Encoded bytes
 * @throws PipelineError(Render) if encoding fails
 */
[[nodiscard]] Bytes encode_image(const cv::Mat& image, OutputFormat format, int quality);

}  // namespace nxc
