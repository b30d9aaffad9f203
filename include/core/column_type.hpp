#pragma once

#include <cstdint>
#include <string>

namespace sqlmcp {

/**
 * @brief Database-agnostic column type classification
 *
 * Mapped from ODBC SQL data types. Decides how a fetched cell is shaped
 * into a CellValue.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    BOOLEAN,
    TINYINT,
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,

    // Exact numerics (kept as text to preserve precision)
    NUMERIC,

    // String family
    TEXT,
    CHAR,
    VARCHAR,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    // Binary
    BLOB,

    UUID,
    XML,

    VENDOR_SPECIFIC,
};

/**
 * @brief Column type info carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    int32_t vendor_type_id = 0;        // ODBC SQL_* data type code
    std::string vendor_type_name;      // "int", "nvarchar", ...

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, int32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline constexpr bool is_integer_type(GenericColumnType t) noexcept {
    return t == GenericColumnType::TINYINT || t == GenericColumnType::SMALLINT ||
           t == GenericColumnType::INTEGER || t == GenericColumnType::BIGINT;
}

[[nodiscard]] inline constexpr bool is_floating_type(GenericColumnType t) noexcept {
    return t == GenericColumnType::REAL || t == GenericColumnType::DOUBLE_PRECISION;
}

} // namespace sqlmcp
