#include "server/stdio_server.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmcp {

StdioServer::StdioServer(std::shared_ptr<const McpDispatcher> dispatcher,
                         const ServerConfig& config,
                         std::shared_ptr<ShutdownCoordinator> shutdown,
                         std::istream& in,
                         std::ostream& out)
    : dispatcher_(std::move(dispatcher)),
      shutdown_(std::move(shutdown)),
      in_(in),
      out_(out),
      pool_(config.workers, config.max_queue) {}

void StdioServer::run() {
    utils::log::info(std::format("Serving MCP on stdio ({} workers)", pool_.worker_count()));

    std::string line;
    while (!shutdown_->is_shutting_down() && std::getline(in_, line)) {
        if (utils::trim_left(line).empty()) {
            continue;
        }
        ++received_;

        auto parsed = McpDispatcher::parse(line);
        if (parsed.reply) {
            write_line(*parsed.reply);
            continue;
        }
        if (parsed.ignore) {
            continue;
        }
        submit(std::move(parsed));
    }

    shutdown_->initiate_shutdown();
    utils::log::info(std::format("Input closed, draining {} in-flight requests",
                                 shutdown_->in_flight_count()));
    const bool drained = shutdown_->wait_for_drain();
    if (!drained) {
        utils::log::warn(std::format("Shutdown timeout with {} requests still in flight",
                                     shutdown_->in_flight_count()));
    }
    pool_.shutdown(drained);
    utils::log::info("Stdio server stopped");
}

void StdioServer::submit(McpDispatcher::ParsedMessage parsed) {
    auto guard = std::make_shared<RequestGuard>(*shutdown_);
    if (!guard->entered()) {
        if (!parsed.is_notification) {
            write_line(McpDispatcher::error_response(parsed.id, mcp::kServerBusy,
                                                     "server shutting down"));
        }
        return;
    }

    const json id = parsed.id;
    const bool is_notification = parsed.is_notification;
    auto message = std::make_shared<McpDispatcher::ParsedMessage>(std::move(parsed));

    const bool queued = pool_.try_submit([this, guard, message] {
        if (auto response = dispatcher_->dispatch(*message)) {
            write_line(*response);
        }
    });

    if (!queued) {
        ++busy_rejects_;
        utils::log::warn("Worker queue full, request refused");
        if (!is_notification) {
            write_line(McpDispatcher::busy_response(id));
        }
    }
}

void StdioServer::write_line(const std::string& line) {
    std::lock_guard lock(out_mutex_);
    out_ << line << '\n';
    out_.flush();
}

} // namespace sqlmcp
