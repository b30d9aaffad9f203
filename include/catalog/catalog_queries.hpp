#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp::catalog {

// ============================================================================
// Fixed catalog SQL (SQL Server system views)
//
// None of this text is caller-supplied, so it bypasses read-only validation.
// Caller values only ever travel as positional '?' parameters.
// ============================================================================

inline constexpr std::string_view kListDatabases =
    "SELECT name, database_id, state_desc, recovery_model_desc "
    "FROM sys.databases "
    "ORDER BY name";

inline constexpr std::string_view kListTables =
    "SELECT s.name AS schema_name, t.name AS table_name, "
    "t.create_date, t.modify_date, t.is_ms_shipped, t.temporal_type_desc "
    "FROM sys.tables t "
    "JOIN sys.schemas s ON t.schema_id = s.schema_id "
    "ORDER BY s.name, t.name";

inline constexpr std::string_view kListViews =
    "SELECT s.name AS schema_name, v.name AS view_name, "
    "v.create_date, v.modify_date, v.is_ms_shipped "
    "FROM sys.views v "
    "JOIN sys.schemas s ON v.schema_id = s.schema_id "
    "ORDER BY s.name, v.name";

inline constexpr std::string_view kListStoredProcedures =
    "SELECT s.name AS schema_name, p.name AS procedure_name, "
    "p.create_date, p.modify_date, p.is_ms_shipped, p.type_desc "
    "FROM sys.procedures p "
    "JOIN sys.schemas s ON p.schema_id = s.schema_id "
    "ORDER BY s.name, p.name";

inline constexpr std::string_view kListIndexes =
    "SELECT s.name AS schema_name, t.name AS table_name, i.name AS index_name, "
    "i.type_desc, i.is_unique, i.is_primary_key, i.is_disabled, i.fill_factor "
    "FROM sys.indexes i "
    "JOIN sys.tables t ON i.object_id = t.object_id "
    "JOIN sys.schemas s ON t.schema_id = s.schema_id "
    "WHERE i.name IS NOT NULL "
    "ORDER BY s.name, t.name, i.name";

/**
 * @brief Statement text plus its positional parameters, in bind order
 */
struct ParameterizedQuery {
    std::string sql;
    std::vector<std::string> params;
};

/// Columns of a table or view
[[nodiscard]] ParameterizedQuery list_columns(const std::string& table,
                                              const std::optional<std::string>& schema);

/// Primary key, unique, foreign key, check and default constraints of a table
[[nodiscard]] ParameterizedQuery list_constraints(const std::string& table,
                                                  const std::optional<std::string>& schema);

/// Foreign key column pairs, optionally narrowed to one referencing table
[[nodiscard]] ParameterizedQuery list_foreign_keys(const std::optional<std::string>& table,
                                                   const std::optional<std::string>& schema);

/// Objects the named object references, and objects that reference it
[[nodiscard]] ParameterizedQuery list_dependencies(const std::string& object,
                                                   const std::optional<std::string>& schema);

} // namespace sqlmcp::catalog
