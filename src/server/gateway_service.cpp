/**
 * @file    gateway_service.cpp
 * @brief   Conversion endpoints, independent of the HTTP library
 * @license MIT
 */

#include "server/gateway_service.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/chrono.h>

#include <chrono>
#include <ctime>
#include <exception>
#include <new>

namespace nxc::server {

using json = nlohmann::json;

namespace {

std::string to_body(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

HttpReply binary_reply(const Bytes& data, std::string content_type) {
    HttpReply reply;
    reply.status = 200;
    reply.content_type = std::move(content_type);
    reply.body = to_body(data);
    return reply;
}

HttpReply from_result(const ImageResult& result) {
    if (!result.success) {
        return error_reply(result.error, result.message, result.detail);
    }
    return binary_reply(result.data, result.content_type);
}

std::optional<std::string> optional_field(const FormFields& fields, const char* name) {
    const auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::optional<std::string_view> field_view(const FormFields& fields, const char* name) {
    const auto it = fields.find(name);
    if (it == fields.end()) return std::nullopt;
    return std::string_view(it->second);
}

const UploadedFile& require_file(const GatewayRequest& request, const char* name) {
    const UploadedFile* file = request.file(name);
    if (!file || file->content.empty()) {
        throw PipelineError(ErrorKind::Validation,
                            fmt::format("Field \"{}\" is required", name));
    }
    return *file;
}

}  // anonymous namespace

// =============================================================================
// GatewayRequest
// =============================================================================

const UploadedFile* GatewayRequest::file(const std::string& name) const {
    const auto it = files.find(name);
    return it != files.end() ? &it->second : nullptr;
}

std::optional<Bytes> GatewayRequest::file_content(const std::string& name) const {
    const UploadedFile* part = file(name);
    if (!part || part->content.empty()) return std::nullopt;
    return part->content;
}

// =============================================================================
// Free helpers
// =============================================================================

HttpReply error_reply(ErrorKind kind, const std::string& message, const std::string& detail) {
    json body = {
        {"success", false},
        {"kind", to_string(kind)},
        {"error", message},
    };
    if (!detail.empty()) {
        body["details"] = detail;
    }

    HttpReply reply;
    reply.status = http_status(kind);
    reply.content_type = "application/json";
    // Tool output may carry invalid UTF-8
    reply.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return reply;
}

HttpReply status_reply(int status) {
    HttpReply reply;
    switch (status) {
        case 404:
            reply = error_reply(ErrorKind::Validation, "Not found");
            break;
        case 405:
            reply = error_reply(ErrorKind::Validation, "Method not allowed");
            break;
        case 413:
            reply = error_reply(ErrorKind::Validation, "Payload too large");
            break;
        default:
            reply = status < 500
                    ? error_reply(ErrorKind::Validation, "Bad request")
                    : error_reply(ErrorKind::Render, "Internal server error");
            break;
    }
    reply.status = status;
    return reply;
}

HttpReply exception_reply(const std::exception_ptr& error) {
    try {
        if (error) std::rethrow_exception(error);
    } catch (const PipelineError& e) {
        return error_reply(e.kind(), e.what(), e.detail());
    } catch (const std::exception& e) {
        spdlog::error("Unhandled exception: {}", e.what());
        return error_reply(ErrorKind::Render, "Internal server error", e.what());
    } catch (...) {
        spdlog::error("Unhandled non-standard exception");
    }
    return error_reply(ErrorKind::Render, "Internal server error");
}

std::string iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), millis);
}

// =============================================================================
// GatewayService
// =============================================================================

GatewayService::GatewayService(
    const CompositionEngine& engine,
    external::ITranscoder& transcoder,
    external::IDocumentExporter& exporter,
    external::IMediaFetcher& fetcher,
    const std::atomic<bool>* cancel_flag)
    : engine_(engine)
    , transcoder_(transcoder)
    , exporter_(exporter)
    , fetcher_(fetcher)
    , cancel_flag_(cancel_flag) {}

CancelCheck GatewayService::cancel_check(const GatewayRequest& request) const {
    return [this, &request] {
        if (cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed)) return true;
        return request.is_disconnected && request.is_disconnected();
    };
}

template <typename Fn>
HttpReply GatewayService::run_tool(const GatewayRequest& request, const char* route, Fn&& fn) const {
    try {
        if (cancel_check(request)()) {
            throw PipelineError(ErrorKind::Cancelled, "Request cancelled");
        }
        const external::ToolOutput output = fn();
        return binary_reply(output.data, output.content_type);
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::Validation) {
            spdlog::warn("{}: {}", route, e.what());
        } else {
            spdlog::error("{}: {} ({})", route, e.what(), e.detail());
        }
        return error_reply(e.kind(), e.what(), e.detail());
    } catch (const std::bad_alloc&) {
        spdlog::error("{}: out of memory", route);
        return error_reply(ErrorKind::ExternalTool, "Out of memory");
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", route, e.what());
        return error_reply(ErrorKind::ExternalTool, "Conversion failed", e.what());
    }
}

HttpReply GatewayService::convert_image(const GatewayRequest& request) const {
    ComposeRequest compose;
    compose.subject = request.file_content(field::kImage);
    compose.watermark = request.file_content(field::kWatermark);
    compose.fields = request.fields;

    const ImageResult result = engine_.compose(compose, cancel_check(request));
    if (result.success) {
        spdlog::info("/convert/image: {} ({} bytes)", result.content_type, result.data.size());
    } else {
        spdlog::warn("/convert/image: {}: {}", to_string(result.error), result.message);
    }
    return from_result(result);
}

HttpReply GatewayService::convert_format(const GatewayRequest& request) const {
    const ImageResult result = engine_.convert(request.file_content(field::kImage),
                                               request.fields);
    if (!result.success) {
        spdlog::warn("/convert/format: {}: {}", to_string(result.error), result.message);
    }
    return from_result(result);
}

HttpReply GatewayService::convert_video(const GatewayRequest& request) const {
    return run_tool(request, "/convert/video", [&] {
        const UploadedFile& video = require_file(request, "video");

        external::TranscodeOptions options;
        options.container = external::format_token(
            field_view(request.fields, "format"), "format", "mp4");
        options.video_bitrate = optional_field(request.fields, "videoBitrate");
        options.audio_bitrate = optional_field(request.fields, "audioBitrate");
        return transcoder_.transcode(video.content, options);
    });
}

HttpReply GatewayService::convert_document(const GatewayRequest& request) const {
    return run_tool(request, "/convert/document", [&] {
        const UploadedFile& document = require_file(request, "document");

        external::ExportOptions options;
        options.format = external::format_token(
            field_view(request.fields, "format"), "format", "pdf");
        options.filter = optional_field(request.fields, "filter");
        return exporter_.export_document(document.content, document.filename, options);
    });
}

HttpReply GatewayService::convert_youtube(const GatewayRequest& request) const {
    return run_tool(request, "/convert/youtube", [&] {
        const auto url = optional_field(request.fields, "url");
        if (!url) {
            throw PipelineError(ErrorKind::Validation, "Parameter \"url\" is required");
        }
        const std::string container = external::format_token(
            field_view(request.fields, "format"), "format", "mp4");
        return fetcher_.fetch(*url, container);
    });
}

HttpReply GatewayService::health() const {
    const json body = {
        {"status", "ok"},
        {"version", kVersion},
        {"timestamp", iso_timestamp()},
    };

    HttpReply reply;
    reply.status = 200;
    reply.content_type = "application/json";
    reply.body = body.dump();
    return reply;
}

}  // namespace nxc::server
