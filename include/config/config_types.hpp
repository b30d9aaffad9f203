#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sqlmcp {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief SQL Server connection parameters (shared by every session)
 */
struct ConnectionConfig {
    std::string server;                                   // host or host\instance
    std::optional<std::string> port;                      // appended as "host,port"
    std::string database = "master";                      // default catalog for unscoped calls
    std::string driver = "{ODBC Driver 17 for SQL Server}";  // preferred ODBC driver
    bool encrypt = true;
    bool trust_server_certificate = true;
    uint32_t connection_timeout_seconds = 30;             // login timeout
    std::optional<std::string> application_intent;        // e.g. "ReadOnly"
    std::string username;                                 // empty = Windows/Kerberos trusted login
    std::string password;
    std::string application_name = "SQL MCP";
};

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
};

enum class Transport {
    STDIO,
    HTTP
};

inline const char* transport_to_string(Transport t) {
    switch (t) {
        case Transport::STDIO: return "stdio";
        case Transport::HTTP: return "http";
        default: return "unknown";
    }
}

struct ServerConfig {
    Transport transport = Transport::STDIO;
    std::string host = "127.0.0.1";
    int port = 8080;
    size_t workers = 4;                     // request worker threads
    size_t max_queue = 64;                  // pending requests before "server busy"
    uint32_t shutdown_timeout_ms = 30000;   // Graceful shutdown timeout
    TlsConfig tls;                          // HTTP transport only
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Complete process configuration
 *
 * Loaded once at startup and never mutated; components borrow the pieces
 * they need by const reference.
 */
struct Settings {
    ConnectionConfig sql;
    ExecutionPolicy policy;
    ServerConfig server;
    LoggingConfig logging;
};

} // namespace sqlmcp
