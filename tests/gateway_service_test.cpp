/**
 * @file    gateway_service_test.cpp
 * @brief   Endpoint tests for the conversion gateway (no sockets)
 */

#include <gtest/gtest.h>
#include "server/gateway_service.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <stdexcept>

using namespace nxc;
using namespace nxc::server;
using json = nlohmann::json;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Fakes
// ─────────────────────────────────────────────────────────────────────────────

class FakeTranscoder : public external::ITranscoder {
public:
    external::ToolOutput transcode(const Bytes& media,
                                   const external::TranscodeOptions& options) override {
        ++calls;
        last_options = options;
        if (fail) {
            throw PipelineError(ErrorKind::ExternalTool, "Failed to convert the video", "boom");
        }
        return {media, "video/" + options.container};
    }

    int calls = 0;
    bool fail = false;
    external::TranscodeOptions last_options;
};

class FakeExporter : public external::IDocumentExporter {
public:
    external::ToolOutput export_document(const Bytes&, std::string_view original_name,
                                         const external::ExportOptions& options) override {
        last_name = std::string(original_name);
        last_options = options;
        const std::string body = "exported";
        return {Bytes(body.begin(), body.end()), external::document_content_type(options.format)};
    }

    std::string last_name;
    external::ExportOptions last_options;
};

class FakeFetcher : public external::IMediaFetcher {
public:
    external::ToolOutput fetch(std::string_view url, std::string_view container) override {
        if (!external::is_fetchable_url(url)) {
            throw PipelineError(ErrorKind::Validation, "Parameter \"url\" must be an http(s) URL");
        }
        last_url = std::string(url);
        return {Bytes{'m', 'p', '4'}, "video/" + std::string(container)};
    }

    std::string last_url;
};

UploadedFile upload(Bytes content, std::string filename = "upload.bin") {
    UploadedFile file;
    file.filename = std::move(filename);
    file.content_type = "application/octet-stream";
    file.content = std::move(content);
    return file;
}

class GatewayServiceTest : public ::testing::Test {
protected:
    GatewayService service() {
        return GatewayService(engine_, transcoder_, exporter_, fetcher_, &stopping_);
    }

    GatewayRequest image_request() const {
        GatewayRequest request;
        request.files.emplace("image", upload(test::solid_png({300, 200}, test::kOpaqueRed)));
        request.files.emplace("watermark", upload(test::solid_png({100, 100}, test::kOpaqueBlue)));
        return request;
    }

    static json body_of(const HttpReply& reply) {
        return json::parse(reply.body);
    }

    CompositionEngine engine_;
    FakeTranscoder transcoder_;
    FakeExporter exporter_;
    FakeFetcher fetcher_;
    std::atomic<bool> stopping_{false};
};

}  // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Status mapping
// ─────────────────────────────────────────────────────────────────────────────

TEST(HttpStatusTest, ErrorKinds) {
    EXPECT_EQ(http_status(ErrorKind::Validation), 400);
    EXPECT_EQ(http_status(ErrorKind::Decode), 400);
    EXPECT_EQ(http_status(ErrorKind::Render), 500);
    EXPECT_EQ(http_status(ErrorKind::ExternalTool), 500);
    EXPECT_EQ(http_status(ErrorKind::Cancelled), 503);
}

TEST(ErrorReplyTest, JsonShape) {
    const HttpReply reply = error_reply(ErrorKind::Decode, "bad image", "libpng says no");
    const json body = json::parse(reply.body);

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.content_type, "application/json");
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["kind"], "DecodeError");
    EXPECT_EQ(body["error"], "bad image");
    EXPECT_EQ(body["details"], "libpng says no");
}

TEST(ErrorReplyTest, DetailsOmittedWhenEmpty) {
    const json body = json::parse(error_reply(ErrorKind::Validation, "missing").body);
    EXPECT_FALSE(body.contains("details"));
}

TEST(ErrorReplyTest, InvalidUtf8IsReplaced) {
    const HttpReply reply = error_reply(ErrorKind::ExternalTool, "failed", "\xff\xfe tail");
    EXPECT_NO_THROW((void)json::parse(reply.body));
}

TEST(StatusReplyTest, KeepsTransportStatus) {
    const HttpReply missing = status_reply(404);
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.content_type, "application/json");
    EXPECT_EQ(json::parse(missing.body)["success"], false);
    EXPECT_EQ(json::parse(missing.body)["error"], "Not found");

    const HttpReply too_large = status_reply(413);
    EXPECT_EQ(too_large.status, 413);
    EXPECT_EQ(json::parse(too_large.body)["kind"], "ValidationError");
    EXPECT_EQ(json::parse(too_large.body)["error"], "Payload too large");

    const HttpReply internal = status_reply(500);
    EXPECT_EQ(internal.status, 500);
    EXPECT_EQ(json::parse(internal.body)["kind"], "RenderError");
}

TEST(ExceptionReplyTest, StandardExceptionIs500WithDetails) {
    const HttpReply reply = exception_reply(
        std::make_exception_ptr(std::runtime_error("multipart parse failed")));
    const json body = json::parse(reply.body);

    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["details"], "multipart parse failed");
}

TEST(ExceptionReplyTest, PipelineErrorKeepsItsKind) {
    const HttpReply reply = exception_reply(
        std::make_exception_ptr(PipelineError(ErrorKind::Validation, "bad field")));

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(json::parse(reply.body)["error"], "bad field");
}

TEST(ExceptionReplyTest, NonStandardExceptionStillJson) {
    const HttpReply reply = exception_reply(std::make_exception_ptr(42));

    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(json::parse(reply.body)["kind"], "RenderError");
}

// ─────────────────────────────────────────────────────────────────────────────
// Images
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(GatewayServiceTest, ConvertImageReturnsEncodedImage) {
    GatewayRequest request = image_request();
    request.fields = {{"format", "png"}, {"layout", "overlay"}};

    const HttpReply reply = service().convert_image(request);

    ASSERT_EQ(reply.status, 200) << reply.body;
    EXPECT_EQ(reply.content_type, "image/png");
    const Bytes bytes(reply.body.begin(), reply.body.end());
    EXPECT_EQ(test::decode(bytes).size(), cv::Size(1200, 1200));
}

TEST_F(GatewayServiceTest, ConvertImageMissingWatermarkIs400) {
    GatewayRequest request = image_request();
    request.files.erase("watermark");

    const HttpReply reply = service().convert_image(request);

    EXPECT_EQ(reply.status, 400);
    const json body = body_of(reply);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["kind"], "ValidationError");
    EXPECT_NE(body["error"].get<std::string>().find("watermark"), std::string::npos);
}

TEST_F(GatewayServiceTest, ConvertImageUndecodableIs400) {
    GatewayRequest request = image_request();
    request.files["image"] = upload(Bytes{'n', 'o', 'p', 'e'});

    const HttpReply reply = service().convert_image(request);

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(body_of(reply)["kind"], "DecodeError");
}

TEST_F(GatewayServiceTest, ShutdownCancelsCompositionWith503) {
    stopping_ = true;

    const HttpReply reply = service().convert_image(image_request());

    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(body_of(reply)["kind"], "Cancelled");
}

TEST_F(GatewayServiceTest, ClientDisconnectCancelsComposition) {
    GatewayRequest request = image_request();
    request.is_disconnected = [] { return true; };

    const HttpReply reply = service().convert_image(request);

    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(body_of(reply)["kind"], "Cancelled");
}

TEST_F(GatewayServiceTest, ConnectedClientIsServed) {
    GatewayRequest request = image_request();
    request.is_disconnected = [] { return false; };

    EXPECT_EQ(service().convert_image(request).status, 200);
}

TEST_F(GatewayServiceTest, ConvertFormatHonoursFormat) {
    GatewayRequest request;
    request.files.emplace("image", upload(test::solid_png({64, 32}, test::kOpaqueBlue)));
    request.fields = {{"format", "jpeg"}, {"quality", "50"}};

    const HttpReply reply = service().convert_format(request);

    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type, "image/jpeg");
}

TEST_F(GatewayServiceTest, ConvertFormatWithoutImageIs400) {
    const HttpReply reply = service().convert_format(GatewayRequest{});
    EXPECT_EQ(reply.status, 400);
}

// ─────────────────────────────────────────────────────────────────────────────
// External tools
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(GatewayServiceTest, ConvertVideoForwardsOptions) {
    GatewayRequest request;
    request.files.emplace("video", upload(Bytes{1, 2, 3}, "clip.mov"));
    request.fields = {{"format", "WebM"}, {"videoBitrate", "1M"}, {"audioBitrate", ""}};

    const HttpReply reply = service().convert_video(request);

    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type, "video/webm");
    EXPECT_EQ(reply.body, std::string("\x01\x02\x03"));
    EXPECT_EQ(transcoder_.last_options.container, "webm");
    EXPECT_EQ(transcoder_.last_options.video_bitrate, std::optional<std::string>("1M"));
    EXPECT_FALSE(transcoder_.last_options.audio_bitrate.has_value());
}

TEST_F(GatewayServiceTest, ConvertVideoDefaultsToMp4) {
    GatewayRequest request;
    request.files.emplace("video", upload(Bytes{1}));

    const HttpReply reply = service().convert_video(request);

    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(transcoder_.last_options.container, "mp4");
}

TEST_F(GatewayServiceTest, ConvertVideoMissingUploadIs400) {
    const HttpReply reply = service().convert_video(GatewayRequest{});

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(transcoder_.calls, 0);
}

TEST_F(GatewayServiceTest, ConvertVideoRejectsUnsafeFormat) {
    GatewayRequest request;
    request.files.emplace("video", upload(Bytes{1}));
    request.fields = {{"format", "mp4; ls"}};

    const HttpReply reply = service().convert_video(request);

    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(transcoder_.calls, 0);
}

TEST_F(GatewayServiceTest, ToolFailureIs500WithDetails) {
    transcoder_.fail = true;
    GatewayRequest request;
    request.files.emplace("video", upload(Bytes{1}));

    const HttpReply reply = service().convert_video(request);

    EXPECT_EQ(reply.status, 500);
    const json body = body_of(reply);
    EXPECT_EQ(body["kind"], "ExternalToolError");
    EXPECT_EQ(body["details"], "boom");
}

TEST_F(GatewayServiceTest, ConvertDocumentPassesFilenameAndFilter) {
    GatewayRequest request;
    request.files.emplace("document", upload(Bytes{'x'}, "slides.pptx"));
    request.fields = {{"filter", "impress_pdf_Export"}};

    const HttpReply reply = service().convert_document(request);

    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type, "application/pdf");
    EXPECT_EQ(reply.body, "exported");
    EXPECT_EQ(exporter_.last_name, "slides.pptx");
    EXPECT_EQ(exporter_.last_options.format, "pdf");
    EXPECT_EQ(exporter_.last_options.filter, std::optional<std::string>("impress_pdf_Export"));
}

TEST_F(GatewayServiceTest, ConvertYoutubeRequiresUrl) {
    const HttpReply reply = service().convert_youtube(GatewayRequest{});

    EXPECT_EQ(reply.status, 400);
    EXPECT_NE(body_of(reply)["error"].get<std::string>().find("url"), std::string::npos);
}

TEST_F(GatewayServiceTest, ConvertYoutubeFetches) {
    GatewayRequest request;
    request.fields = {{"url", "https://www.youtube.com/watch?v=abc"}};

    const HttpReply reply = service().convert_youtube(request);

    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type, "video/mp4");
    EXPECT_EQ(fetcher_.last_url, "https://www.youtube.com/watch?v=abc");
}

TEST_F(GatewayServiceTest, ToolEndpointsRefuseDuringShutdown) {
    stopping_ = true;
    GatewayRequest request;
    request.fields = {{"url", "https://example.com/v"}};

    EXPECT_EQ(service().convert_youtube(request).status, 503);
    EXPECT_TRUE(fetcher_.last_url.empty());
}

TEST_F(GatewayServiceTest, ToolEndpointsSkipDisconnectedClients) {
    GatewayRequest request;
    request.files.emplace("video", upload(Bytes{'v', 'i', 'd'}, "clip.mov"));
    request.is_disconnected = [] { return true; };

    EXPECT_EQ(service().convert_video(request).status, 503);
    EXPECT_EQ(transcoder_.calls, 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(GatewayServiceTest, HealthReportsVersionAndTime) {
    const HttpReply reply = service().health();

    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type, "application/json");
    const json body = body_of(reply);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["version"], kVersion);

    const std::string timestamp = body["timestamp"];
    ASSERT_EQ(timestamp.size(), 24u);
    EXPECT_EQ(timestamp[10], 'T');
    EXPECT_EQ(timestamp.back(), 'Z');
}
