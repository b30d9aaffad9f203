#include "catalog/catalog_queries.hpp"

namespace sqlmcp::catalog {

ParameterizedQuery list_columns(const std::string& table,
                                const std::optional<std::string>& schema) {
    ParameterizedQuery q;
    q.sql =
        "SELECT s.name AS schema_name, o.name AS table_name, c.column_id, "
        "c.name AS column_name, ty.name AS data_type, c.max_length, c.precision, "
        "c.scale, c.is_nullable, c.is_identity, c.is_computed "
        "FROM sys.columns c "
        "JOIN sys.objects o ON c.object_id = o.object_id "
        "JOIN sys.schemas s ON o.schema_id = s.schema_id "
        "JOIN sys.types ty ON c.user_type_id = ty.user_type_id "
        "WHERE o.type IN ('U', 'V') AND o.name = ?";
    q.params.push_back(table);
    if (schema) {
        q.sql += " AND s.name = ?";
        q.params.push_back(*schema);
    }
    q.sql += " ORDER BY s.name, o.name, c.column_id";
    return q;
}

ParameterizedQuery list_constraints(const std::string& table,
                                    const std::optional<std::string>& schema) {
    ParameterizedQuery q;
    q.sql =
        "SELECT s.name AS schema_name, t.name AS table_name, "
        "o.name AS constraint_name, o.type_desc "
        "FROM sys.objects o "
        "JOIN sys.tables t ON o.parent_object_id = t.object_id "
        "JOIN sys.schemas s ON t.schema_id = s.schema_id "
        "WHERE o.type IN ('PK', 'UQ', 'F', 'C', 'D') AND t.name = ?";
    q.params.push_back(table);
    if (schema) {
        q.sql += " AND s.name = ?";
        q.params.push_back(*schema);
    }
    q.sql += " ORDER BY s.name, t.name, o.type_desc, o.name";
    return q;
}

ParameterizedQuery list_foreign_keys(const std::optional<std::string>& table,
                                     const std::optional<std::string>& schema) {
    ParameterizedQuery q;
    q.sql =
        "SELECT fk.name AS foreign_key_name, "
        "ps.name AS parent_schema, pt.name AS parent_table, pc.name AS parent_column, "
        "rs.name AS referenced_schema, rt.name AS referenced_table, "
        "rc.name AS referenced_column, fkc.constraint_column_id, "
        "fk.delete_referential_action_desc, fk.update_referential_action_desc "
        "FROM sys.foreign_keys fk "
        "JOIN sys.foreign_key_columns fkc ON fk.object_id = fkc.constraint_object_id "
        "JOIN sys.tables pt ON fkc.parent_object_id = pt.object_id "
        "JOIN sys.schemas ps ON pt.schema_id = ps.schema_id "
        "JOIN sys.columns pc ON fkc.parent_object_id = pc.object_id "
        "AND fkc.parent_column_id = pc.column_id "
        "JOIN sys.tables rt ON fkc.referenced_object_id = rt.object_id "
        "JOIN sys.schemas rs ON rt.schema_id = rs.schema_id "
        "JOIN sys.columns rc ON fkc.referenced_object_id = rc.object_id "
        "AND fkc.referenced_column_id = rc.column_id "
        "WHERE 1 = 1";
    if (table) {
        q.sql += " AND pt.name = ?";
        q.params.push_back(*table);
    }
    if (schema) {
        q.sql += " AND ps.name = ?";
        q.params.push_back(*schema);
    }
    q.sql += " ORDER BY ps.name, pt.name, fk.name, fkc.constraint_column_id";
    return q;
}

ParameterizedQuery list_dependencies(const std::string& object,
                                     const std::optional<std::string>& schema) {
    ParameterizedQuery q;
    q.sql =
        "SELECT OBJECT_SCHEMA_NAME(d.referencing_id) AS referencing_schema, "
        "OBJECT_NAME(d.referencing_id) AS referencing_object, "
        "o.type_desc AS referencing_type, "
        "COALESCE(d.referenced_schema_name, OBJECT_SCHEMA_NAME(d.referenced_id)) AS referenced_schema, "
        "d.referenced_entity_name AS referenced_object, "
        "d.referenced_database_name "
        "FROM sys.sql_expression_dependencies d "
        "JOIN sys.objects o ON d.referencing_id = o.object_id "
        "WHERE (OBJECT_NAME(d.referencing_id) = ?";
    q.params.push_back(object);
    if (schema) {
        q.sql += " AND OBJECT_SCHEMA_NAME(d.referencing_id) = ?";
        q.params.push_back(*schema);
    }
    q.sql += ") OR (d.referenced_entity_name = ?";
    q.params.push_back(object);
    if (schema) {
        q.sql += " AND COALESCE(d.referenced_schema_name, OBJECT_SCHEMA_NAME(d.referenced_id)) = ?";
        q.params.push_back(*schema);
    }
    q.sql += ") ORDER BY referencing_schema, referencing_object, referenced_object";
    return q;
}

} // namespace sqlmcp::catalog
