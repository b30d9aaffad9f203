#pragma once

#include "config/config_types.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"

#include <sql.h>
#include <sqlext.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp::odbc {

/**
 * @brief Owns the ODBC environment handle (ODBC 3 behaviour)
 *
 * Shared by the factory and every connection it opens, so the environment
 * outlives all of its connections. Driver-manager connection pooling is
 * left off: a session is never handed to a second request.
 */
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    [[nodiscard]] SQLHENV handle() const { return henv_; }

    /// Driver names registered with the driver manager
    [[nodiscard]] std::vector<std::string> installed_drivers() const;

private:
    SQLHENV henv_ = SQL_NULL_HENV;
};

/**
 * @brief SQL Server session implementing IDbConnection
 *
 * Wraps an SQLHDBC. All ODBC calls for a session are encapsulated here.
 */
class OdbcConnection : public IDbConnection {
public:
    /**
     * @brief Construct from a connected SQLHDBC (takes ownership)
     */
    OdbcConnection(std::shared_ptr<OdbcEnvironment> env, SQLHDBC hdbc);

    ~OdbcConnection() override;

    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;

    DbResultSet execute(const std::string& sql,
                        const std::vector<std::string>& params) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_seconds) override;
    void close() override;

private:
    /**
     * @brief Describe and fetch the current result set of hstmt
     */
    DbResultSet read_result_set(SQLHSTMT hstmt);

    std::shared_ptr<OdbcEnvironment> env_;
    SQLHDBC hdbc_;
    uint32_t query_timeout_seconds_ = 0;
};

/**
 * @brief Opens OdbcConnection sessions against the configured server
 *
 * Resolves the driver on every connect, then builds the connection string
 * for the requested catalog.
 */
class OdbcConnectionFactory : public IConnectionFactory {
public:
    explicit OdbcConnectionFactory(ConnectionConfig config);

    Result<std::unique_ptr<IDbConnection>> connect(const std::string& database) override;

private:
    ConnectionConfig config_;
    std::shared_ptr<OdbcEnvironment> env_;
};

/// "[SQLSTATE] (native) message | ..." for every diagnostic record on handle
[[nodiscard]] std::string diag_message(SQLSMALLINT handle_type, SQLHANDLE handle);

/// First SQLSTATE on handle, or empty
[[nodiscard]] std::string first_sql_state(SQLSMALLINT handle_type, SQLHANDLE handle);

/// HYT00 (query timeout) / HYT01 (connection timeout)
[[nodiscard]] bool is_timeout_sql_state(std::string_view state);

} // namespace sqlmcp::odbc
