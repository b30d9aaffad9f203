#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace sqlmcp {

// ============================================================================
// ConfigLoader - Extract typed Settings from TOML plus environment
// ============================================================================

/**
 * @brief Builds the process Settings
 *
 * Precedence per key: TOML value, then environment variable, then default.
 * String values may reference ${VAR}; unset variables expand to "".
 * An empty document is valid, so a deployment can run from the environment
 * alone.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        Settings config;

        static LoadResult ok(Settings cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load settings from a TOML file
     * @param config_path Path to sql_mcp.toml
     * @return LoadResult with parsed settings or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load settings from TOML text
     * @param toml_content TOML content (may be empty)
     * @return LoadResult with parsed settings or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per violation; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const Settings& config);

private:
    static LoadResult extract_and_validate(const toml::table& root);

    static ConnectionConfig extract_sql(const toml::table& root);
    static ExecutionPolicy extract_policy(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
};

} // namespace sqlmcp
