/**
 * @file    gateway_server.cpp
 * @brief   HTTP binding of the conversion gateway
 * @license MIT
 */

#include "server/gateway_server.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <exception>
#include <thread>

namespace nxc::server {

namespace {

constexpr std::size_t kMinThreads = 2;
constexpr time_t kReadTimeoutSec = 300;
constexpr time_t kWriteTimeoutSec = 300;
constexpr std::chrono::milliseconds kStopPollInterval{5};

// Multipart parts become uploads; parts without a file name are also form fields.
// Query and urlencoded parameters become form fields.
GatewayRequest to_gateway_request(const httplib::Request& req) {
    GatewayRequest out;
    out.is_disconnected = req.is_connection_closed;

    for (const auto& [key, value] : req.params) {
        out.fields.emplace(key, value);
    }

    for (const auto& [key, part] : req.files) {
        if (part.filename.empty()) {
            out.fields.insert_or_assign(key, part.content);
        }
        UploadedFile file;
        file.filename = part.filename;
        file.content_type = part.content_type;
        file.content.assign(part.content.begin(), part.content.end());
        out.files.emplace(key, std::move(file));
    }
    return out;
}

void apply(const HttpReply& reply, httplib::Response& res) {
    res.status = reply.status;
    res.set_content(reply.body, reply.content_type);
}

}  // anonymous namespace

GatewayServer::GatewayServer(ServerConfig config)
    : config_(std::move(config))
    , workspace_(config_.tmp_dir)
    , transcoder_(config_.ffmpeg, workspace_)
    , exporter_(config_.soffice, workspace_)
    , fetcher_(config_.ytdlp, workspace_)
    , service_(engine_, transcoder_, exporter_, fetcher_, &stopping_)
    , http_(std::make_unique<httplib::Server>())
{
    const std::size_t threads = std::max(config_.threads, kMinThreads);
    http_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    http_->set_payload_max_length(config_.max_upload_mb * 1024 * 1024);
    http_->set_read_timeout(kReadTimeoutSec, 0);
    http_->set_write_timeout(kWriteTimeoutSec, 0);

    register_routes();
}

GatewayServer::~GatewayServer() = default;

void GatewayServer::register_routes() {
    http_->set_pre_routing_handler([](const httplib::Request& req, httplib::Response&) {
        spdlog::info("Request received: {} {}", req.method, req.path);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Bodies the routes did not write (404, 413, ...) become JSON too
    http_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        apply(status_reply(res.status), res);
    });

    http_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr error) {
            spdlog::error("{} {}: handler threw", req.method, req.path);
            apply(exception_reply(error), res);
        });

    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::debug("{} {} -> {} ({} bytes)", req.method, req.path, res.status, res.body.size());
    });

    http_->Post("/convert/image", [this](const httplib::Request& req, httplib::Response& res) {
        apply(service_.convert_image(to_gateway_request(req)), res);
    });

    http_->Post("/convert/format", [this](const httplib::Request& req, httplib::Response& res) {
        apply(service_.convert_format(to_gateway_request(req)), res);
    });

    http_->Post("/convert/video", [this](const httplib::Request& req, httplib::Response& res) {
        apply(service_.convert_video(to_gateway_request(req)), res);
    });

    http_->Post("/convert/document", [this](const httplib::Request& req, httplib::Response& res) {
        apply(service_.convert_document(to_gateway_request(req)), res);
    });

    http_->Get("/convert/youtube", [this](const httplib::Request& req, httplib::Response& res) {
        apply(service_.convert_youtube(to_gateway_request(req)), res);
    });

    http_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        apply(service_.health(), res);
    });
}

bool GatewayServer::run() {
    {
        const std::lock_guard<std::mutex> lock(listen_mutex_);
        if (stopping_.load()) {
            spdlog::info("Stop requested before start");
            return true;
        }
        if (!http_->bind_to_port(config_.host, config_.port)) {
            spdlog::error("Failed to bind {}:{}", config_.host, config_.port);
            return false;
        }
        serving_ = true;
    }

    spdlog::info("Listening on {}:{} ({} workers, upload limit {} MB, tmp {})",
                 config_.host, config_.port, std::max(config_.threads, kMinThreads),
                 config_.max_upload_mb, workspace_.root().string());

    const bool clean = http_->listen_after_bind();
    {
        const std::lock_guard<std::mutex> lock(listen_mutex_);
        serving_ = false;
    }

    if (!clean && !stopping_.load()) {
        spdlog::error("Listener on {}:{} failed", config_.host, config_.port);
        return false;
    }
    spdlog::info("Server stopped");
    return true;
}

void GatewayServer::stop() {
    if (stopping_.exchange(true)) return;
    spdlog::info("Shutting down...");

    // Bound but not yet accepting: wait until the listener runs, then close it
    for (;;) {
        {
            const std::lock_guard<std::mutex> lock(listen_mutex_);
            if (!serving_) return;
            if (http_->is_running()) {
                http_->stop();
                return;
            }
        }
        std::this_thread::sleep_for(kStopPollInterval);
    }
}

}  // namespace nxc::server
