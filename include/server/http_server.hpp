#pragma once

#include "config/config_types.hpp"
#include "server/mcp_dispatcher.hpp"
#include "server/shutdown_coordinator.hpp"
#include "server/worker_pool.hpp"

#include <atomic>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlmcp {

/**
 * @brief MCP over HTTP: one JSON-RPC message per POST /mcp
 *
 * Connection handling runs on cpp-httplib's thread pool; the requests
 * themselves run on the same bounded WorkerPool as the stdio transport, so
 * a full queue is answered with -32000 "server busy" (HTTP 503).
 * GET /health answers {"status":"ok"}. HTTPS when [server.tls] is enabled.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const McpDispatcher> dispatcher,
               const ServerConfig& config,
               std::shared_ptr<ShutdownCoordinator> shutdown);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve; blocks until stop(). Throws if the port cannot be bound.
    void start();

    void stop();

    struct Reply {
        int status;
        std::string body;        // empty for 202
    };

    /**
     * @brief Transport-independent handling of one POST body
     *
     * 200 with the response, 202 for notifications, 400 for malformed
     * messages, 503 when busy or shutting down.
     */
    [[nodiscard]] Reply handle_message(const std::string& body);

    [[nodiscard]] uint64_t busy_rejects() const {
        return busy_rejects_.load(std::memory_order_relaxed);
    }

private:
    void handle_mcp(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<const McpDispatcher> dispatcher_;
    ServerConfig config_;
    std::shared_ptr<ShutdownCoordinator> shutdown_;
    WorkerPool pool_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> busy_rejects_{0};
};

} // namespace sqlmcp
