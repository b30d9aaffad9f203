#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlmcp {

// Environment variable names (shared with deployments that configure by env only)
static constexpr const char* kEnvHost                = "SQL_SERVER_HOST";
static constexpr const char* kEnvPort                = "SQL_SERVER_PORT";
static constexpr const char* kEnvDatabase            = "SQL_SERVER_DATABASE";
static constexpr const char* kEnvDriver              = "SQL_DRIVER";
static constexpr const char* kEnvEncrypt             = "SQL_ENCRYPT";
static constexpr const char* kEnvTrustCert           = "SQL_TRUST_SERVER_CERTIFICATE";
static constexpr const char* kEnvConnectionTimeout   = "SQL_CONNECTION_TIMEOUT";
static constexpr const char* kEnvApplicationIntent   = "SQL_APPLICATION_INTENT";
static constexpr const char* kEnvUsername            = "SQL_USERNAME";
static constexpr const char* kEnvPassword            = "SQL_PASSWORD";
static constexpr const char* kEnvEnforceReadonly     = "SQL_ENFORCE_READONLY";
static constexpr const char* kEnvMaxQueryChars       = "SQL_MAX_QUERY_CHARS";
static constexpr const char* kEnvMaxRows             = "SQL_MAX_ROWS";
static constexpr const char* kEnvQueryTimeout        = "SQL_QUERY_TIMEOUT";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Lookup helpers (TOML first, then environment) -------------------------

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || *v == '\0') return std::nullopt;
    return std::string(v);
}

std::optional<std::string> pick_string(const toml::table* tbl, std::string_view key,
                                       const char* env_name) {
    if (tbl) {
        if (auto v = (*tbl)[key].value<std::string>()) return v;
    }
    return env_value(env_name);
}

// Unparseable environment integers count as absent
std::optional<int64_t> pick_int(const toml::table* tbl, std::string_view key,
                                const char* env_name) {
    if (tbl) {
        if (auto v = (*tbl)[key].value<int64_t>()) return v;
    }
    if (auto e = env_value(env_name)) {
        return utils::try_parse_int<int64_t>(utils::trim_right(utils::trim_left(*e)));
    }
    return std::nullopt;
}

std::optional<bool> pick_bool(const toml::table* tbl, std::string_view key,
                              const char* env_name) {
    if (tbl) {
        if (auto v = (*tbl)[key].value<bool>()) return v;
    }
    if (auto e = env_value(env_name)) {
        return utils::parse_bool(*e);
    }
    return std::nullopt;
}

// Non-positive values become 0 so validation can report them
uint32_t positive_or_zero(int64_t v) {
    if (v <= 0) return 0;
    if (v > static_cast<int64_t>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(v);
}

std::optional<Transport> parse_transport(const std::string& name) {
    const std::string n = utils::to_lower(name);
    if (n == "stdio") return Transport::STDIO;
    if (n == "http") return Transport::HTTP;
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConnectionConfig ConfigLoader::extract_sql(const toml::table& root) {
    ConnectionConfig cfg;
    const auto* sql = root["sql"].as_table();

    cfg.server = pick_string(sql, "server", kEnvHost).value_or(""s);

    // Port may be written as a number or a string
    if (sql) {
        if (auto p = (*sql)["port"].value<int64_t>()) {
            cfg.port = std::to_string(*p);
        }
    }
    if (!cfg.port) {
        cfg.port = pick_string(sql, "port", kEnvPort);
    }

    if (auto v = pick_string(sql, "database", kEnvDatabase)) cfg.database = *v;
    if (auto v = pick_string(sql, "driver", kEnvDriver)) cfg.driver = *v;
    if (auto v = pick_bool(sql, "encrypt", kEnvEncrypt)) cfg.encrypt = *v;
    if (auto v = pick_bool(sql, "trust_server_certificate", kEnvTrustCert)) {
        cfg.trust_server_certificate = *v;
    }
    if (auto v = pick_int(sql, "connection_timeout", kEnvConnectionTimeout)) {
        cfg.connection_timeout_seconds = positive_or_zero(*v);
    }
    cfg.application_intent = pick_string(sql, "application_intent", kEnvApplicationIntent);
    cfg.username = pick_string(sql, "username", kEnvUsername).value_or(""s);
    cfg.password = pick_string(sql, "password", kEnvPassword).value_or(""s);
    if (sql) {
        cfg.application_name = (*sql)["application_name"].value_or(cfg.application_name);
    }
    return cfg;
}

ExecutionPolicy ConfigLoader::extract_policy(const toml::table& root) {
    ExecutionPolicy policy;
    const auto* sql = root["sql"].as_table();

    if (auto v = pick_bool(sql, "enforce_readonly", kEnvEnforceReadonly)) {
        policy.enforce_readonly = *v;
    }
    if (auto v = pick_int(sql, "max_query_chars", kEnvMaxQueryChars)) {
        policy.max_query_chars = positive_or_zero(*v);
    }
    if (auto v = pick_int(sql, "max_rows", kEnvMaxRows)) {
        policy.max_rows = positive_or_zero(*v);
    }
    if (auto v = pick_int(sql, "query_timeout", kEnvQueryTimeout)) {
        policy.query_timeout_seconds = positive_or_zero(*v);
    }
    return policy;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    if (auto t = s["transport"].value<std::string>()) {
        auto transport = parse_transport(*t);
        if (!transport) {
            throw std::runtime_error(
                std::format("server.transport must be \"stdio\" or \"http\", got \"{}\"", *t));
        }
        cfg.transport = *transport;
    }

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(s["port"].value_or(static_cast<int64_t>(cfg.port)));
    cfg.workers = static_cast<size_t>(
        std::max<int64_t>(0, s["workers"].value_or(static_cast<int64_t>(cfg.workers))));
    cfg.max_queue = static_cast<size_t>(
        std::max<int64_t>(0, s["max_queue"].value_or(static_cast<int64_t>(cfg.max_queue))));
    cfg.shutdown_timeout_ms = positive_or_zero(
        s["shutdown_timeout_ms"].value_or(static_cast<int64_t>(cfg.shutdown_timeout_ms)));

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
    }

    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    Settings config;
    config.sql = extract_sql(root);
    config.policy = extract_policy(root);
    config.server = extract_server(root);
    config.logging = extract_logging(root);

    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const Settings& config) {
    std::vector<std::string> errors;

    if (utils::trim(config.sql.server).empty()) {
        errors.emplace_back("sql.server (or SQL_SERVER_HOST) is required");
    }
    if (config.sql.connection_timeout_seconds == 0) {
        errors.emplace_back("sql.connection_timeout must be > 0");
    }
    if (config.policy.max_query_chars == 0) {
        errors.emplace_back("sql.max_query_chars must be > 0");
    }
    if (config.policy.max_rows == 0) {
        errors.emplace_back("sql.max_rows must be > 0");
    } else if (config.policy.max_rows > static_cast<uint32_t>(INT32_MAX)) {
        // SET ROWCOUNT takes a signed int
        errors.push_back(std::format("sql.max_rows must be <= {}, got {}",
                                     INT32_MAX, config.policy.max_rows));
    }
    if (config.policy.query_timeout_seconds == 0) {
        errors.emplace_back("sql.query_timeout must be > 0");
    }

    if (config.server.workers == 0) {
        errors.emplace_back("server.workers must be > 0");
    }
    if (config.server.max_queue == 0) {
        errors.emplace_back("server.max_queue must be > 0");
    }

    if (config.server.transport == Transport::HTTP) {
        if (config.server.port < 1 || config.server.port > 65535) {
            errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
        }
        if (config.server.tls.enabled) {
            if (config.server.tls.cert_file.empty()) {
                errors.emplace_back("server.tls.cert_file required when TLS is enabled");
            }
            if (config.server.tls.key_file.empty()) {
                errors.emplace_back("server.tls.key_file required when TLS is enabled");
            }
        }
    }

    if (!utils::log::is_level_name(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got \"{}\"",
                                     config.logging.level));
    }

    return errors;
}

} // namespace sqlmcp
