#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace sqlmcp::odbc {

/**
 * @brief ODBC SQL data type -> generic column type
 *
 * Covers the ODBC 3 codes plus SQL Server driver extensions
 * (time2, datetimeoffset, xml, sql_variant).
 */
class OdbcTypeMap {
public:
    [[nodiscard]] static GenericColumnType to_generic(int32_t sql_type);

    [[nodiscard]] static ColumnTypeInfo make_info(int32_t sql_type, std::string type_name);
};

} // namespace sqlmcp::odbc
