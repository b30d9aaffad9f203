#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlmcp {

/**
 * @brief Abstract factory for opening database sessions
 *
 * The server and connection parameters are fixed at construction; callers
 * only choose the catalog. Failures come back as CONNECTION_ERROR with the
 * driver's message.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> connect(
        const std::string& database) = 0;
};

} // namespace sqlmcp
