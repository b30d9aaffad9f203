#pragma once

#include "config/config_types.hpp"
#include "server/mcp_constants.hpp"
#include "server/mcp_dispatcher.hpp"
#include "server/shutdown_coordinator.hpp"
#include "server/worker_pool.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace sqlmcp {

/**
 * @brief MCP over newline-delimited JSON on stdin/stdout
 *
 * The reader thread parses each line and hands requests to the worker pool;
 * responses are written one per line, whole, under a lock, in completion
 * order. On EOF (or once shutdown starts) reading stops and in-flight
 * requests are drained within the configured timeout.
 */
class StdioServer {
public:
    StdioServer(std::shared_ptr<const McpDispatcher> dispatcher,
                const ServerConfig& config,
                std::shared_ptr<ShutdownCoordinator> shutdown,
                std::istream& in,
                std::ostream& out);

    /// Blocks until input ends or shutdown is initiated, then drains
    void run();

    struct Stats {
        uint64_t received;
        uint64_t busy_rejects;
    };
    [[nodiscard]] Stats get_stats() const {
        return {received_, busy_rejects_};
    }

private:
    void submit(McpDispatcher::ParsedMessage parsed);
    void write_line(const std::string& line);

    std::shared_ptr<const McpDispatcher> dispatcher_;
    std::shared_ptr<ShutdownCoordinator> shutdown_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
    WorkerPool pool_;

    uint64_t received_ = 0;         // reader thread only
    uint64_t busy_rejects_ = 0;     // reader thread only
};

} // namespace sqlmcp
