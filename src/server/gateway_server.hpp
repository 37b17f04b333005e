/**
 * @file    gateway_server.hpp
 * @brief   HTTP binding of the conversion gateway
 * @license MIT
 *
 * @details
 * Owns the tool adapters, the composition engine and the httplib server.
 * Requests are served by a fixed worker pool; stop() closes the listener
 * and raises the cancel flag so in-flight work aborts early. A request
 * whose client disconnects is cancelled the same way.
 */

#pragma once

#include "core/composition_engine.hpp"
#include "external/external_tools.hpp"
#include "external/temp_workspace.hpp"
#include "server/gateway_service.hpp"
#include "server/server_config.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace httplib {
class Server;
}  // namespace httplib

namespace nxc::server {

class GatewayServer {
public:
    explicit GatewayServer(ServerConfig config);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /**
     * Bind and serve until stop() is called
     *
     * Returns at once if stop() already ran.
     *
     * @return  false if the address could not be bound
     */
    bool run();

    // Thread-safe; callable from any thread
    void stop();

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

private:
    void register_routes();

    ServerConfig config_;
    std::atomic<bool> stopping_{false};
    std::mutex listen_mutex_;
    bool serving_{false};           // Between bind and listener exit, guarded by listen_mutex_

    external::TempWorkspace workspace_;
    CompositionEngine engine_;
    external::FfmpegTranscoder transcoder_;
    external::LibreOfficeExporter exporter_;
    external::YtDlpFetcher fetcher_;
    GatewayService service_;

    std::unique_ptr<httplib::Server> http_;
};

}  // namespace nxc::server
