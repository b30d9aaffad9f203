#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp::odbc {

/// Drivers tried, in order, when the preferred one is not installed
inline constexpr std::string_view kFallbackDrivers[] = {
    "ODBC Driver 18 for SQL Server",
    "ODBC Driver 17 for SQL Server",
    "SQL Server",
};

/**
 * @brief Pick the ODBC driver to use
 * @param preferred Configured driver name, braces optional ("{...}")
 * @param installed Driver names reported by the driver manager
 * @return Braced driver name, or CONNECTION_ERROR when none is usable
 *
 * Matching is case-insensitive. The preferred driver wins when installed.
 */
[[nodiscard]] Result<std::string> resolve_driver(std::string_view preferred,
                                                 const std::vector<std::string>& installed);

/**
 * @brief Brace-quote a connection-string value when it needs it
 *
 * Values containing ';', '{' or '}', or with surrounding spaces, are wrapped
 * in braces with '}' doubled. Others are returned unchanged.
 */
[[nodiscard]] std::string quote_value(std::string_view value);

/**
 * @brief Build the SQL Server connection string for one catalog
 * @param config Connection parameters
 * @param driver Resolved (braced) driver name
 * @param database Target catalog
 */
[[nodiscard]] std::string build_connection_string(const ConnectionConfig& config,
                                                  std::string_view driver,
                                                  std::string_view database);

} // namespace sqlmcp::odbc
