#include "server/http_server.hpp"
#include "server/mcp_constants.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <future>
#include <stdexcept>

namespace sqlmcp {

HttpServer::HttpServer(std::shared_ptr<const McpDispatcher> dispatcher,
                       const ServerConfig& config,
                       std::shared_ptr<ShutdownCoordinator> shutdown)
    : dispatcher_(std::move(dispatcher)),
      config_(config),
      shutdown_(std::move(shutdown)),
      pool_(config.workers, config.max_queue) {}

HttpServer::~HttpServer() {
    stop();
}

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    const auto& tls = config_.tls;
    if (tls.enabled) {
        server_ = std::make_unique<httplib::SSLServer>(tls.cert_file.c_str(), tls.key_file.c_str());
        if (!server_->is_valid()) {
            throw std::runtime_error(std::format(
                "Failed to load TLS certificate/key: cert={}, key={}", tls.cert_file, tls.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}", tls.cert_file, tls.key_file));
    } else {
        server_ = std::make_unique<httplib::Server>();
    }
    auto& svr = *server_;

    // Connection threads mostly wait on the worker pool, so size for the queue too
    const size_t pool_size = config_.workers + config_.max_queue;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    svr.Post(mcp::kMcpPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_mcp(req, res);
    });
    svr.Get(mcp::kHealthPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    utils::log::info(std::format("Serving MCP on {}://{}:{}{} ({} workers, queue {})",
        tls.enabled ? "https" : "http", config_.host, config_.port, mcp::kMcpPath,
        config_.workers, config_.max_queue));

    if (!svr.listen(config_.host, config_.port)) {
        if (!shutdown_->is_shutting_down()) {
            throw std::runtime_error(std::format(
                "Failed to start HTTP server on {}:{}", config_.host, config_.port));
        }
    }

    shutdown_->initiate_shutdown();
    if (!shutdown_->wait_for_drain()) {
        utils::log::warn(std::format("Shutdown timeout with {} requests still in flight",
                                     shutdown_->in_flight_count()));
    }
    pool_.shutdown(false);
    utils::log::info("HTTP server stopped");
}

void HttpServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_mcp(const httplib::Request& req, httplib::Response& res) {
    const auto reply = handle_message(req.body);
    res.status = reply.status;
    if (!reply.body.empty()) {
        res.set_content(reply.body, mcp::kJsonContentType);
    }
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    if (shutdown_->is_shutting_down()) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"status":"shutting_down"})", mcp::kJsonContentType);
        return;
    }
    res.set_content(R"({"status":"ok"})", mcp::kJsonContentType);
}

HttpServer::Reply HttpServer::handle_message(const std::string& body) {
    auto parsed = McpDispatcher::parse(body);
    if (parsed.reply) {
        return {400, std::move(*parsed.reply)};
    }
    if (parsed.ignore) {
        return {202, {}};
    }

    auto guard = std::make_shared<RequestGuard>(*shutdown_);
    if (!guard->entered()) {
        return {503, McpDispatcher::error_response(parsed.id, mcp::kServerBusy,
                                                   "server shutting down")};
    }

    const json id = parsed.id;
    auto message = std::make_shared<McpDispatcher::ParsedMessage>(std::move(parsed));
    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    auto future = promise->get_future();

    const bool queued = pool_.try_submit([this, guard, message, promise] {
        promise->set_value(dispatcher_->dispatch(*message));
    });
    if (!queued) {
        busy_rejects_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn("Worker queue full, request refused");
        return {503, McpDispatcher::busy_response(id)};
    }

    try {
        auto response = future.get();
        if (!response) {
            return {202, {}};
        }
        return {200, std::move(*response)};
    } catch (const std::future_error&) {
        // Task dropped at shutdown before it ran
        return {503, McpDispatcher::error_response(id, mcp::kServerBusy, "server shutting down")};
    }
}

} // namespace sqlmcp
