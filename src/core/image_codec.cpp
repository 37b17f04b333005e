/**
 * @file    image_codec.cpp
 * @brief   In-memory image decode/encode implementation
 * @license MIT
 */

#include "core/image_codec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace nxc {

cv::Mat decode_image(const Bytes& bytes, std::string_view name) {
    if (bytes.empty()) {
        throw PipelineError(ErrorKind::Decode, fmt::format("Field \"{}\" is empty", name));
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw PipelineError(ErrorKind::Decode,
                            fmt::format("Field \"{}\" is not a decodable image", name),
                            e.what());
    }

    if (decoded.empty()) {
        throw PipelineError(ErrorKind::Decode,
                            fmt::format("Field \"{}\" is not a decodable image", name));
    }

    // Normalize depth
    if (decoded.depth() == CV_16U) {
        decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
    } else if (decoded.depth() == CV_32F) {
        decoded.convertTo(decoded, CV_8U, 255.0);
    } else if (decoded.depth() != CV_8U) {
        throw PipelineError(ErrorKind::Decode,
                            fmt::format("Field \"{}\" has an unsupported pixel depth", name));
    }

    // Normalize channels to BGRA
    cv::Mat bgra;
    switch (decoded.channels()) {
        case 1:  cv::cvtColor(decoded, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3:  cv::cvtColor(decoded, bgra, cv::COLOR_BGR2BGRA);  break;
        case 4:  bgra = decoded; break;
        default:
            throw PipelineError(ErrorKind::Decode,
                                fmt::format("Field \"{}\" has {} channels", name, decoded.channels()));
    }

    spdlog::debug("Decoded {}: {}x{} ({} channels, {} bytes)",
                  name, bgra.cols, bgra.rows, decoded.channels(), bytes.size());
    return bgra;
}

Bytes encode_image(const cv::Mat& image, OutputFormat format, int quality) {
    if (image.empty()) {
        throw PipelineError(ErrorKind::Render, "Nothing to encode");
    }

    // Determine output format and quality
    std::vector<int> params;
    const char* ext = ".jpg";
    cv::Mat source = image;

    if (format == OutputFormat::Png) {
        ext = ".png";
        params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    } else {
        params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, kMinQuality, kMaxQuality)};
        if (source.channels() == 4) {
            cv::cvtColor(source, source, cv::COLOR_BGRA2BGR);
        }
    }

    Bytes encoded;
    bool ok = false;
    try {
        ok = cv::imencode(ext, source, encoded, params);
    } catch (const cv::Exception& e) {
        throw PipelineError(ErrorKind::Render, "Failed to encode image", e.what());
    }
    if (!ok || encoded.empty()) {
        throw PipelineError(ErrorKind::Render,
                            fmt::format("Failed to encode image as {}", to_string(format)));
    }

    spdlog::debug("Encoded {}x{} as {} ({} bytes)",
                  source.cols, source.rows, to_string(format), encoded.size());
    return encoded;
}

}  // namespace nxc
