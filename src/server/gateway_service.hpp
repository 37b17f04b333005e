/**
 * @file    gateway_service.hpp
 * @brief   Conversion endpoints, independent of the HTTP library
 * @license MIT
 *
 * @details
 * Each handler takes the already parsed request (uploads + string fields)
 * and returns a complete reply. Failures become JSON bodies:
 *   {"success": false, "kind": "...", "error": "...", "details": "..."}
 */

#pragma once

#include "core/composition_engine.hpp"
#include "external/external_tools.hpp"

#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace nxc::server {

/**
 * One uploaded multipart part
 */
struct UploadedFile {
    std::string filename;
    std::string content_type;
    Bytes content;
};

/**
 * Transport-independent request: uploads plus query/form fields
 */
struct GatewayRequest {
    std::unordered_map<std::string, UploadedFile> files;
    FormFields fields;
    CancelCheck is_disconnected;    // True once the client has gone away

    [[nodiscard]] const UploadedFile* file(const std::string& name) const;
    [[nodiscard]] std::optional<Bytes> file_content(const std::string& name) const;
};

/**
 * Complete HTTP reply
 */
struct HttpReply {
    int status{200};
    std::string content_type;
    std::string body;
};

// HTTP status for an error category
[[nodiscard]] constexpr int http_status(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:         return 200;
        case ErrorKind::Validation:   return 400;
        case ErrorKind::Decode:       return 400;
        case ErrorKind::Render:       return 500;
        case ErrorKind::ExternalTool: return 500;
        case ErrorKind::Cancelled:    return 503;
        default:                      return 500;
    }
}

// JSON error reply
[[nodiscard]] HttpReply error_reply(ErrorKind kind, const std::string& message,
                                    const std::string& detail = {});

// JSON body for a status the HTTP layer produced itself (404, 413, ...)
[[nodiscard]] HttpReply status_reply(int status);

// JSON 500 for an exception that escaped a route handler
[[nodiscard]] HttpReply exception_reply(const std::exception_ptr& error);

// Current UTC time as ISO-8601 with milliseconds ("2026-01-02T03:04:05.678Z")
[[nodiscard]] std::string iso_timestamp();

class GatewayService {
public:
    /**
     * @param engine       Composition engine (stateless, shared)
     * @param transcoder   Video converter
     * @param exporter     Document converter
     * @param fetcher      Remote media downloader
     * @param cancel_flag  Set when the server shuts down; aborts work in flight
     */
    GatewayService(
        const CompositionEngine& engine,
        external::ITranscoder& transcoder,
        external::IDocumentExporter& exporter,
        external::IMediaFetcher& fetcher,
        const std::atomic<bool>* cancel_flag = nullptr
    );

    // POST /convert/image  (image + watermark -> composed product image)
    [[nodiscard]] HttpReply convert_image(const GatewayRequest& request) const;

    // POST /convert/format  (image -> re-encoded image)
    [[nodiscard]] HttpReply convert_format(const GatewayRequest& request) const;

    // POST /convert/video
    [[nodiscard]] HttpReply convert_video(const GatewayRequest& request) const;

    // POST /convert/document
    [[nodiscard]] HttpReply convert_document(const GatewayRequest& request) const;

    // GET /convert/youtube?url=...&format=mp4
    [[nodiscard]] HttpReply convert_youtube(const GatewayRequest& request) const;

    // GET /health
    [[nodiscard]] HttpReply health() const;

private:
    template <typename Fn>
    HttpReply run_tool(const GatewayRequest& request, const char* route, Fn&& fn) const;

    // Server shutdown or client disconnect
    [[nodiscard]] CancelCheck cancel_check(const GatewayRequest& request) const;

    const CompositionEngine& engine_;
    external::ITranscoder& transcoder_;
    external::IDocumentExporter& exporter_;
    external::IMediaFetcher& fetcher_;
    const std::atomic<bool>* cancel_flag_;
};

}  // namespace nxc::server
