#pragma once

#include "catalog/catalog_queries.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iconnection_factory.hpp"
#include "db/scoped_connection.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp {

/**
 * @brief Metadata listings over SQL Server system views
 *
 * Each call opens its own scoped session, runs one fixed statement under
 * the policy's statement timeout and returns every row (no row cap).
 * Errors follow QueryExecutor: CONNECTION_ERROR from the factory,
 * EXECUTION_ERROR with reason "timeout" or "statement".
 */
class CatalogService {
public:
    using Rows = std::vector<ShapedRow>;

    /**
     * @param default_database Catalog used by list_databases
     */
    CatalogService(std::shared_ptr<IConnectionFactory> factory,
                   const ExecutionPolicy& policy,
                   std::string default_database,
                   ScopedConnection::ReleaseFunc release_fn = nullptr);

    [[nodiscard]] Result<Rows> list_databases() const;
    [[nodiscard]] Result<Rows> list_tables(const std::string& database) const;
    [[nodiscard]] Result<Rows> list_views(const std::string& database) const;
    [[nodiscard]] Result<Rows> list_stored_procedures(const std::string& database) const;
    [[nodiscard]] Result<Rows> list_indexes(const std::string& database) const;

    [[nodiscard]] Result<Rows> list_columns(const std::string& database,
                                            const std::string& table,
                                            const std::optional<std::string>& schema) const;
    [[nodiscard]] Result<Rows> list_constraints(const std::string& database,
                                                const std::string& table,
                                                const std::optional<std::string>& schema) const;
    [[nodiscard]] Result<Rows> list_foreign_keys(const std::string& database,
                                                 const std::optional<std::string>& table,
                                                 const std::optional<std::string>& schema) const;
    [[nodiscard]] Result<Rows> list_dependencies(const std::string& database,
                                                 const std::string& object,
                                                 const std::optional<std::string>& schema) const;

    [[nodiscard]] const std::string& default_database() const { return default_database_; }

private:
    [[nodiscard]] Result<Rows> fetch(const std::string& database,
                                     std::string_view label,
                                     const catalog::ParameterizedQuery& query) const;

    std::shared_ptr<IConnectionFactory> factory_;
    const ExecutionPolicy& policy_;
    std::string default_database_;
    ScopedConnection::ReleaseFunc release_fn_;
};

} // namespace sqlmcp
