#include "db/odbc/odbc_connection_string.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace sqlmcp::odbc {

namespace {

std::string_view strip_braces(std::string_view name) {
    name = utils::trim_right(utils::trim_left(name));
    if (name.size() >= 2 && name.front() == '{' && name.back() == '}') {
        name = name.substr(1, name.size() - 2);
    }
    return name;
}

} // anonymous namespace

Result<std::string> resolve_driver(std::string_view preferred,
                                   const std::vector<std::string>& installed) {
    std::unordered_map<std::string, std::string> by_lower;
    for (const auto& name : installed) {
        by_lower.emplace(utils::to_lower(name), name);
    }

    if (!strip_braces(preferred).empty()) {
        const auto it = by_lower.find(utils::to_lower(strip_braces(preferred)));
        if (it != by_lower.end()) {
            return Result<std::string>::ok("{" + it->second + "}");
        }
    }

    for (const auto fallback : kFallbackDrivers) {
        const auto it = by_lower.find(utils::to_lower(fallback));
        if (it != by_lower.end()) {
            return Result<std::string>::ok("{" + it->second + "}");
        }
    }

    return Result<std::string>::error(ErrorCategory::CONNECTION_ERROR,
        "No SQL Server ODBC driver found. Install ODBC Driver 17 or 18.", "no-driver");
}

std::string quote_value(std::string_view value) {
    const bool needs_quotes =
        value.find_first_of(";{}") != std::string_view::npos ||
        (!value.empty() && (utils::is_space(value.front()) || utils::is_space(value.back())));
    if (!needs_quotes) {
        return std::string(value);
    }

    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '{';
    for (const char c : value) {
        quoted += c;
        if (c == '}') quoted += '}';
    }
    quoted += '}';
    return quoted;
}

std::string build_connection_string(const ConnectionConfig& config,
                                    std::string_view driver,
                                    std::string_view database) {
    std::string server = config.server;
    if (config.port && !config.port->empty()) {
        server = std::format("{},{}", server, *config.port);
    }

    std::string conn;
    conn.reserve(256);
    conn += std::format("Driver={};", driver);
    conn += std::format("Server={};", quote_value(server));
    conn += std::format("Database={};", quote_value(database));
    if (config.username.empty()) {
        conn += "Trusted_Connection=yes;";
    } else {
        conn += std::format("UID={};", quote_value(config.username));
        conn += std::format("PWD={};", quote_value(config.password));
    }
    conn += std::format("Encrypt={};", config.encrypt ? "yes" : "no");
    conn += std::format("TrustServerCertificate={};",
                        config.trust_server_certificate ? "yes" : "no");
    conn += std::format("Connection Timeout={};", config.connection_timeout_seconds);
    conn += std::format("Application Name={};", quote_value(config.application_name));
    if (config.application_intent && !config.application_intent->empty()) {
        conn += std::format("ApplicationIntent={};", quote_value(*config.application_intent));
    }
    return conn;
}

} // namespace sqlmcp::odbc
