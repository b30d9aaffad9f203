#include "db/odbc/odbc_connection.hpp"
#include "db/odbc/odbc_connection_string.hpp"
#include "db/odbc/odbc_type_map.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <stdexcept>

namespace sqlmcp::odbc {

namespace {

constexpr size_t kCellChunkSize = 4096;
constexpr size_t kMaxDiagRecords = 20;

inline bool sql_ok(SQLRETURN rc) {
    return rc == SQL_SUCCESS || rc == SQL_SUCCESS_WITH_INFO;
}

inline SQLCHAR* to_sqlchar(const char* s) {
    return const_cast<SQLCHAR*>(reinterpret_cast<const SQLCHAR*>(s));
}

// Frees a statement handle on every exit path
class StatementHandle {
public:
    explicit StatementHandle(SQLHDBC hdbc) {
        if (!sql_ok(SQLAllocHandle(SQL_HANDLE_STMT, hdbc, &hstmt_))) {
            hstmt_ = SQL_NULL_HSTMT;
        }
    }

    ~StatementHandle() {
        if (hstmt_ != SQL_NULL_HSTMT) {
            SQLFreeStmt(hstmt_, SQL_CLOSE);
            SQLFreeHandle(SQL_HANDLE_STMT, hstmt_);
        }
    }

    StatementHandle(const StatementHandle&) = delete;
    StatementHandle& operator=(const StatementHandle&) = delete;

    [[nodiscard]] SQLHSTMT get() const { return hstmt_; }
    [[nodiscard]] bool valid() const { return hstmt_ != SQL_NULL_HSTMT; }

private:
    SQLHSTMT hstmt_ = SQL_NULL_HSTMT;
};

DbResultSet statement_error(SQLHSTMT hstmt, std::string_view where) {
    DbResultSet result;
    result.success = false;
    result.sql_state = first_sql_state(SQL_HANDLE_STMT, hstmt);
    result.timed_out = is_timeout_sql_state(result.sql_state);
    result.error_message = std::format("{}: {}", where, diag_message(SQL_HANDLE_STMT, hstmt));
    return result;
}

/**
 * @brief Read one column of the current row as text, in chunks
 * @return false on a driver error (diagnostics stay on hstmt)
 */
bool read_cell(SQLHSTMT hstmt, SQLUSMALLINT column, DbCell& out) {
    std::string value;
    char buf[kCellChunkSize];

    while (true) {
        SQLLEN indicator = 0;
        const SQLRETURN rc = SQLGetData(hstmt, column, SQL_C_CHAR, buf, sizeof(buf), &indicator);
        if (rc == SQL_NO_DATA) {
            break;
        }
        if (!sql_ok(rc)) {
            return false;
        }
        if (indicator == SQL_NULL_DATA) {
            out = std::nullopt;
            return true;
        }
        const bool truncated = rc == SQL_SUCCESS_WITH_INFO &&
            (indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(sizeof(buf)));
        if (truncated) {
            value.append(buf, sizeof(buf) - 1);  // last byte is the terminator
            continue;
        }
        value.append(buf, static_cast<size_t>(indicator));
        break;
    }

    out = std::move(value);
    return true;
}

} // anonymous namespace

// ============================================================================
// Diagnostics
// ============================================================================

std::string diag_message(SQLSMALLINT handle_type, SQLHANDLE handle) {
    std::string out;
    for (SQLSMALLINT i = 1; i <= static_cast<SQLSMALLINT>(kMaxDiagRecords); ++i) {
        SQLCHAR sql_state[6] = {0};
        SQLINTEGER native_error = 0;
        SQLCHAR message[1024] = {0};
        SQLSMALLINT message_len = 0;

        const SQLRETURN rc = SQLGetDiagRec(handle_type, handle, i, sql_state, &native_error,
                                           message, sizeof(message), &message_len);
        if (!sql_ok(rc)) break;

        if (!out.empty()) out += " | ";
        const auto len = std::min<size_t>(static_cast<size_t>(message_len), sizeof(message) - 1);
        out += std::format("[{}] ({}) {}", reinterpret_cast<const char*>(sql_state), native_error,
                           std::string_view(reinterpret_cast<const char*>(message), len));
    }
    if (out.empty()) out = "ODBC error (no diagnostics)";
    return out;
}

std::string first_sql_state(SQLSMALLINT handle_type, SQLHANDLE handle) {
    SQLCHAR sql_state[6] = {0};
    SQLINTEGER native_error = 0;
    SQLSMALLINT message_len = 0;
    const SQLRETURN rc = SQLGetDiagRec(handle_type, handle, 1, sql_state, &native_error,
                                       nullptr, 0, &message_len);
    if (sql_ok(rc)) {
        return std::string(reinterpret_cast<const char*>(sql_state));
    }
    return {};
}

bool is_timeout_sql_state(std::string_view state) {
    return state == "HYT00" || state == "HYT01";
}

// ============================================================================
// OdbcEnvironment
// ============================================================================

OdbcEnvironment::OdbcEnvironment() {
    if (!sql_ok(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &henv_))) {
        throw std::runtime_error("Failed to allocate ODBC environment handle");
    }

    const SQLRETURN rc = SQLSetEnvAttr(henv_, SQL_ATTR_ODBC_VERSION,
                                       reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);
    if (!sql_ok(rc)) {
        const std::string msg = diag_message(SQL_HANDLE_ENV, henv_);
        SQLFreeHandle(SQL_HANDLE_ENV, henv_);
        henv_ = SQL_NULL_HENV;
        throw std::runtime_error("Failed to set ODBC version: " + msg);
    }
}

OdbcEnvironment::~OdbcEnvironment() {
    if (henv_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, henv_);
    }
}

std::vector<std::string> OdbcEnvironment::installed_drivers() const {
    std::vector<std::string> drivers;
    SQLCHAR description[256];
    SQLCHAR attributes[1024];
    SQLSMALLINT description_len = 0;
    SQLSMALLINT attributes_len = 0;
    SQLUSMALLINT direction = SQL_FETCH_FIRST;

    while (sql_ok(SQLDrivers(henv_, direction,
                             description, sizeof(description), &description_len,
                             attributes, sizeof(attributes), &attributes_len))) {
        const auto len = std::min<size_t>(static_cast<size_t>(description_len),
                                          sizeof(description) - 1);
        drivers.emplace_back(reinterpret_cast<const char*>(description), len);
        direction = SQL_FETCH_NEXT;
    }
    return drivers;
}

// ============================================================================
// OdbcConnection
// ============================================================================

OdbcConnection::OdbcConnection(std::shared_ptr<OdbcEnvironment> env, SQLHDBC hdbc)
    : env_(std::move(env)), hdbc_(hdbc) {}

OdbcConnection::~OdbcConnection() {
    close();
}

DbResultSet OdbcConnection::execute(const std::string& sql,
                                    const std::vector<std::string>& params) {
    if (hdbc_ == SQL_NULL_HDBC) {
        DbResultSet closed;
        closed.error_message = "Connection is closed";
        return closed;
    }

    StatementHandle stmt(hdbc_);
    if (!stmt.valid()) {
        DbResultSet failed;
        failed.error_message = std::format("Failed to allocate statement: {}",
            diag_message(SQL_HANDLE_DBC, hdbc_));
        return failed;
    }

    if (query_timeout_seconds_ > 0) {
        const SQLRETURN rc = SQLSetStmtAttr(stmt.get(), SQL_ATTR_QUERY_TIMEOUT,
            reinterpret_cast<SQLPOINTER>(static_cast<uintptr_t>(query_timeout_seconds_)),
            SQL_IS_UINTEGER);
        if (!sql_ok(rc)) {
            return statement_error(stmt.get(), "Failed to apply statement timeout");
        }
    }

    // Bound buffers must stay alive until execution finishes
    std::vector<SQLLEN> indicators(params.size(), SQL_NTS);
    for (size_t i = 0; i < params.size(); ++i) {
        const auto& p = params[i];
        const SQLRETURN rc = SQLBindParameter(stmt.get(), static_cast<SQLUSMALLINT>(i + 1),
            SQL_PARAM_INPUT, SQL_C_CHAR, SQL_VARCHAR,
            std::max<SQLULEN>(p.size(), 1), 0,
            to_sqlchar(p.c_str()), static_cast<SQLLEN>(p.size() + 1), &indicators[i]);
        if (!sql_ok(rc)) {
            return statement_error(stmt.get(), std::format("Failed to bind parameter {}", i + 1));
        }
    }

    SQLRETURN rc = SQLExecDirect(stmt.get(), to_sqlchar(sql.c_str()), SQL_NTS);
    if (rc == SQL_NO_DATA) {
        DbResultSet empty;
        empty.success = true;
        return empty;
    }
    if (!sql_ok(rc)) {
        return statement_error(stmt.get(), "Statement failed");
    }

    // Skip row-count-only results until one carries columns
    SQLSMALLINT ncols = 0;
    while (true) {
        rc = SQLNumResultCols(stmt.get(), &ncols);
        if (!sql_ok(rc)) {
            return statement_error(stmt.get(), "Failed to describe result");
        }
        if (ncols > 0) {
            break;
        }
        rc = SQLMoreResults(stmt.get());
        if (rc == SQL_NO_DATA) {
            DbResultSet empty;
            empty.success = true;
            return empty;
        }
        if (!sql_ok(rc)) {
            return statement_error(stmt.get(), "Statement failed");
        }
    }

    return read_result_set(stmt.get());
}

DbResultSet OdbcConnection::read_result_set(SQLHSTMT hstmt) {
    DbResultSet result;

    SQLSMALLINT ncols = 0;
    if (!sql_ok(SQLNumResultCols(hstmt, &ncols))) {
        return statement_error(hstmt, "Failed to describe result");
    }

    result.column_names.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));

    for (SQLUSMALLINT col = 1; col <= static_cast<SQLUSMALLINT>(ncols); ++col) {
        SQLCHAR name[512] = {0};
        SQLSMALLINT name_len = 0;
        SQLSMALLINT data_type = 0;
        SQLULEN column_size = 0;
        SQLSMALLINT decimal_digits = 0;
        SQLSMALLINT nullable = 0;

        const SQLRETURN rc = SQLDescribeCol(hstmt, col, name, sizeof(name), &name_len,
                                            &data_type, &column_size, &decimal_digits, &nullable);
        if (!sql_ok(rc)) {
            return statement_error(hstmt, std::format("Failed to describe column {}", col));
        }

        SQLCHAR type_name[128] = {0};
        SQLSMALLINT type_name_len = 0;
        if (!sql_ok(SQLColAttribute(hstmt, col, SQL_DESC_TYPE_NAME, type_name,
                                    sizeof(type_name), &type_name_len, nullptr))) {
            type_name_len = 0;
        }

        const auto nlen = std::min<size_t>(static_cast<size_t>(name_len), sizeof(name) - 1);
        const auto tlen = std::min<size_t>(static_cast<size_t>(type_name_len), sizeof(type_name) - 1);
        result.column_names.emplace_back(reinterpret_cast<const char*>(name), nlen);
        result.column_types.push_back(OdbcTypeMap::make_info(
            data_type, std::string(reinterpret_cast<const char*>(type_name), tlen)));
    }

    while (true) {
        const SQLRETURN rc = SQLFetch(hstmt);
        if (rc == SQL_NO_DATA) {
            break;
        }
        if (!sql_ok(rc)) {
            return statement_error(hstmt, "Fetch failed");
        }

        std::vector<DbCell> row(static_cast<size_t>(ncols));
        for (SQLUSMALLINT col = 1; col <= static_cast<SQLUSMALLINT>(ncols); ++col) {
            if (!read_cell(hstmt, col, row[col - 1])) {
                return statement_error(hstmt, std::format("Failed to read column {}", col));
            }
        }
        result.rows.push_back(std::move(row));
    }

    result.success = true;
    result.has_rows = true;
    return result;
}

bool OdbcConnection::is_connected() const {
    if (hdbc_ == SQL_NULL_HDBC) {
        return false;
    }
    SQLUINTEGER dead = SQL_CD_FALSE;
    const SQLRETURN rc = SQLGetConnectAttr(hdbc_, SQL_ATTR_CONNECTION_DEAD, &dead,
                                           SQL_IS_UINTEGER, nullptr);
    return !sql_ok(rc) || dead != SQL_CD_TRUE;
}

bool OdbcConnection::set_query_timeout(uint32_t timeout_seconds) {
    if (hdbc_ == SQL_NULL_HDBC) {
        return false;
    }
    query_timeout_seconds_ = timeout_seconds;
    return true;
}

void OdbcConnection::close() {
    if (hdbc_ != SQL_NULL_HDBC) {
        SQLDisconnect(hdbc_);
        SQLFreeHandle(SQL_HANDLE_DBC, hdbc_);
        hdbc_ = SQL_NULL_HDBC;
    }
}

// ============================================================================
// OdbcConnectionFactory
// ============================================================================

OdbcConnectionFactory::OdbcConnectionFactory(ConnectionConfig config)
    : config_(std::move(config)),
      env_(std::make_shared<OdbcEnvironment>()) {}

Result<std::unique_ptr<IDbConnection>> OdbcConnectionFactory::connect(const std::string& database) {
    using ConnResult = Result<std::unique_ptr<IDbConnection>>;

    auto driver = resolve_driver(config_.driver, env_->installed_drivers());
    if (driver.is_error()) {
        utils::log::error(driver.error_message());
        return ConnResult::from_error(driver);
    }

    SQLHDBC hdbc = SQL_NULL_HDBC;
    if (!sql_ok(SQLAllocHandle(SQL_HANDLE_DBC, env_->handle(), &hdbc))) {
        return ConnResult::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Failed to allocate connection handle: {}",
                        diag_message(SQL_HANDLE_ENV, env_->handle())),
            "connect");
    }

    SQLSetConnectAttr(hdbc, SQL_ATTR_LOGIN_TIMEOUT,
        reinterpret_cast<SQLPOINTER>(static_cast<uintptr_t>(config_.connection_timeout_seconds)),
        SQL_IS_UINTEGER);

    // The connection string may carry a password: never log it
    const std::string conn_str = build_connection_string(config_, driver.value(), database);
    const SQLRETURN rc = SQLDriverConnect(hdbc, nullptr, to_sqlchar(conn_str.c_str()), SQL_NTS,
                                          nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
    if (!sql_ok(rc)) {
        const std::string msg = diag_message(SQL_HANDLE_DBC, hdbc);
        SQLFreeHandle(SQL_HANDLE_DBC, hdbc);
        return ConnResult::error(ErrorCategory::CONNECTION_ERROR, msg, "connect");
    }

    return ConnResult::ok(std::make_unique<OdbcConnection>(env_, hdbc));
}

} // namespace sqlmcp::odbc
