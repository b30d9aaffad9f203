#include "catalog/catalog_service.hpp"
#include "config/config_loader.hpp"
#include "core/readonly_query_service.hpp"
#include "core/utils.hpp"
#include "db/odbc/odbc_connection.hpp"
#include "executor/query_executor.hpp"
#include "server/http_server.hpp"
#include "server/mcp_dispatcher.hpp"
#include "server/shutdown_coordinator.hpp"
#include "server/stdio_server.hpp"
#include "server/tool_registry.hpp"

#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>

using namespace sqlmcp;

namespace {

// Global instances for signal handling
std::shared_ptr<ShutdownCoordinator> g_shutdown;
std::shared_ptr<HttpServer> g_http_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop accepting new requests; the transports drain what is in flight
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
    }
    if (g_http_server) {
        g_http_server->stop();
    }
}

// No SA_RESTART: a blocked stdin read must return so the stdio loop sees the shutdown
void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("SQL MCP server starting...");

        install_signal_handlers();

        // Configuration: argv[1], else $SQL_MCP_CONFIG, else environment only
        std::string config_file;
        if (argc > 1) {
            config_file = argv[1];
        } else if (const char* env = std::getenv("SQL_MCP_CONFIG")) {
            config_file = env;
        }

        utils::log::info(config_file.empty()
            ? std::string("[1/4] Loading configuration from environment")
            : std::format("[1/4] Loading configuration from {}", config_file));

        const auto loaded = config_file.empty()
            ? ConfigLoader::load_from_string("")
            : ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const Settings settings = loaded.config;
        utils::log::set_level(settings.logging.level);

        utils::log::info(std::format("[2/4] SQL Server {}{} (default database '{}', {})",
            settings.sql.server,
            settings.sql.port ? "," + *settings.sql.port : std::string(),
            settings.sql.database,
            settings.sql.username.empty() ? "trusted connection" : "SQL login"));
        utils::log::info(std::format("Policy: readonly={}, max_query_chars={}, max_rows={}, timeout={}s",
            settings.policy.enforce_readonly, settings.policy.max_query_chars,
            settings.policy.max_rows, settings.policy.query_timeout_seconds));

        auto factory = std::make_shared<odbc::OdbcConnectionFactory>(settings.sql);
        auto executor = std::make_shared<QueryExecutor>(factory, settings.policy);
        auto queries = std::make_shared<ReadonlyQueryService>(executor, settings.policy);
        auto catalog = std::make_shared<CatalogService>(factory, settings.policy, settings.sql.database);

        utils::log::info("[3/4] Registering tools");
        auto tools = std::make_shared<ToolRegistry>(queries, catalog);
        auto dispatcher = std::make_shared<McpDispatcher>(tools);

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds(settings.server.shutdown_timeout_ms);
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);

        utils::log::info(std::format("[4/4] Starting {} transport",
            transport_to_string(settings.server.transport)));

        if (settings.server.transport == Transport::HTTP) {
            g_http_server = std::make_shared<HttpServer>(dispatcher, settings.server, g_shutdown);
            g_http_server->start();
            g_http_server.reset();
        } else {
            // Workers inherit a blocked mask so signals land on the reading thread
            sigset_t signals;
            sigemptyset(&signals);
            sigaddset(&signals, SIGINT);
            sigaddset(&signals, SIGTERM);
            pthread_sigmask(SIG_BLOCK, &signals, nullptr);
            StdioServer server(dispatcher, settings.server, g_shutdown, std::cin, std::cout);
            pthread_sigmask(SIG_UNBLOCK, &signals, nullptr);
            server.run();
        }

        const auto exec_stats = executor->get_stats();
        const auto query_stats = queries->get_stats();
        utils::log::info(std::format(
            "Shutdown complete: {} queries ({} rejected, {} executed, {} failed, {} timeouts)",
            query_stats.total_requests, query_stats.rejected,
            exec_stats.executed, exec_stats.failed, exec_stats.timeouts));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
