#pragma once

#include <array>
#include <string>
#include <string_view>

namespace sqlmcp::mcp {

inline constexpr std::string_view kServerName = "sql-mcp";
inline constexpr std::string_view kServerVersion = "1.0.0";

// Newest first; an unknown client version is answered with the newest
inline constexpr std::array<std::string_view, 3> kSupportedProtocolVersions = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

// JSON-RPC 2.0 error codes
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerBusy = -32000;

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kMcpPath = "/mcp";
inline const std::string kHealthPath = "/health";
inline constexpr const char* kJsonContentType = "application/json";

} // namespace sqlmcp::mcp
