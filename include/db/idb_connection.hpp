#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlmcp {

/// One fetched cell; nullopt is SQL NULL
using DbCell = std::optional<std::string>;

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied out of the driver's buffers).
 */
struct DbResultSet {
    bool success = false;
    bool timed_out = false;           // statement exceeded its timeout
    std::string sql_state;            // first diagnostic SQLSTATE, if any
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<DbCell>> rows;

    // false when the batch produced no result set with columns
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native session. Implementations are not thread-safe; a
 * connection belongs to exactly one request.
 *
 * Does NOT expose native handles to prevent leaking driver types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a batch and materialize the first result set with columns
     * @param sql Batch text
     * @param params Positional '?' parameters, bound as text
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const std::vector<std::string>& params) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set the statement timeout for subsequent executions
     * @param timeout_seconds Timeout in seconds (0 = no timeout)
     * @return true if the timeout was applied
     */
    virtual bool set_query_timeout(uint32_t timeout_seconds) = 0;

    /**
     * @brief Close the connection and release resources. Idempotent.
     */
    virtual void close() = 0;
};

} // namespace sqlmcp
