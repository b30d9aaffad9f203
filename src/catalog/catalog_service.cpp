#include "catalog/catalog_service.hpp"
#include "executor/result_shaper.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmcp {

namespace {

catalog::ParameterizedQuery fixed(std::string_view sql) {
    return {std::string(sql), {}};
}

} // anonymous namespace

CatalogService::CatalogService(std::shared_ptr<IConnectionFactory> factory,
                               const ExecutionPolicy& policy,
                               std::string default_database,
                               ScopedConnection::ReleaseFunc release_fn)
    : factory_(std::move(factory)),
      policy_(policy),
      default_database_(std::move(default_database)),
      release_fn_(std::move(release_fn)) {}

Result<CatalogService::Rows> CatalogService::fetch(const std::string& database,
                                                   std::string_view label,
                                                   const catalog::ParameterizedQuery& query) const {
    utils::Timer timer;

    auto opened = factory_->connect(database);
    if (opened.is_error()) {
        utils::log::error(std::format("{}: connection to '{}' failed: {}",
            label, database, opened.error_message()));
        return Result<Rows>::from_error(opened);
    }

    ScopedConnection conn(std::move(opened.value()), release_fn_);

    try {
        if (!conn->set_query_timeout(policy_.query_timeout_seconds)) {
            conn.discard();
            return Result<Rows>::error(ErrorCategory::EXECUTION_ERROR,
                "Failed to apply statement timeout", "statement");
        }

        const auto db_result = conn->execute(query.sql, query.params);

        if (db_result.timed_out) {
            conn.discard();
            utils::log::error(std::format("{} on '{}' timed out", label, database));
            return Result<Rows>::error(ErrorCategory::EXECUTION_ERROR,
                std::format("Query exceeded the {} second timeout", policy_.query_timeout_seconds),
                "timeout");
        }

        if (!db_result.success) {
            utils::log::error(std::format("{} on '{}' failed: {}",
                label, database, db_result.error_message));
            return Result<Rows>::error(ErrorCategory::EXECUTION_ERROR,
                db_result.error_message, "statement");
        }

        auto rows = ResultShaper::shape_rows(db_result);
        utils::log::info(std::format("{} on '{}' returned {} rows in {} ms",
            label, database, rows.size(), timer.elapsed_ms().count()));
        return Result<Rows>::ok(std::move(rows));

    } catch (const std::exception& e) {
        conn.discard();
        utils::log::error(std::format("{} on '{}' raised: {}", label, database, e.what()));
        return Result<Rows>::error(ErrorCategory::EXECUTION_ERROR,
            std::format("Database error: {}", e.what()), "statement");
    }
}

Result<CatalogService::Rows> CatalogService::list_databases() const {
    return fetch(default_database_, "list_databases", fixed(catalog::kListDatabases));
}

Result<CatalogService::Rows> CatalogService::list_tables(const std::string& database) const {
    return fetch(database, "list_tables", fixed(catalog::kListTables));
}

Result<CatalogService::Rows> CatalogService::list_views(const std::string& database) const {
    return fetch(database, "list_views", fixed(catalog::kListViews));
}

Result<CatalogService::Rows> CatalogService::list_stored_procedures(const std::string& database) const {
    return fetch(database, "list_stored_procedures", fixed(catalog::kListStoredProcedures));
}

Result<CatalogService::Rows> CatalogService::list_indexes(const std::string& database) const {
    return fetch(database, "list_indexes", fixed(catalog::kListIndexes));
}

Result<CatalogService::Rows> CatalogService::list_columns(
        const std::string& database, const std::string& table,
        const std::optional<std::string>& schema) const {
    return fetch(database, "list_columns", catalog::list_columns(table, schema));
}

Result<CatalogService::Rows> CatalogService::list_constraints(
        const std::string& database, const std::string& table,
        const std::optional<std::string>& schema) const {
    return fetch(database, "list_constraints", catalog::list_constraints(table, schema));
}

Result<CatalogService::Rows> CatalogService::list_foreign_keys(
        const std::string& database, const std::optional<std::string>& table,
        const std::optional<std::string>& schema) const {
    return fetch(database, "list_foreign_keys", catalog::list_foreign_keys(table, schema));
}

Result<CatalogService::Rows> CatalogService::list_dependencies(
        const std::string& database, const std::string& object,
        const std::optional<std::string>& schema) const {
    return fetch(database, "list_dependencies", catalog::list_dependencies(object, schema));
}

} // namespace sqlmcp
