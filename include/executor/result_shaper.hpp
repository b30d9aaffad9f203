#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlmcp {

/**
 * @brief Turns positional driver rows into named, typed rows
 *
 * Each row becomes an ordered column-name -> value mapping. When two columns
 * share a name the later value wins and the first position is kept.
 * truncated = (row_count >= limit): the cap was reached, which suggests but
 * does not prove that more rows exist.
 */
class ResultShaper {
public:
    [[nodiscard]] static ResultSet shape(const std::vector<std::string>& columns,
                                         const std::vector<ColumnTypeInfo>& column_types,
                                         std::vector<std::vector<DbCell>> rows,
                                         uint32_t limit);

    /// Untyped variant: every non-NULL value stays text
    [[nodiscard]] static ResultSet shape(const std::vector<std::string>& columns,
                                         std::vector<std::vector<DbCell>> rows,
                                         uint32_t limit);

    [[nodiscard]] static CellValue to_cell(const DbCell& cell, const ColumnTypeInfo& type);

    /// Shape rows with no cap metadata (catalog listings)
    [[nodiscard]] static std::vector<ShapedRow> shape_rows(const DbResultSet& result);
};

} // namespace sqlmcp
