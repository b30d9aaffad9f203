#include "db/odbc/odbc_type_map.hpp"

#include <sql.h>
#include <sqlext.h>

#include <unordered_map>

namespace sqlmcp::odbc {

namespace {

// msodbcsql extensions (sqlncli.h / msodbcsql.h are not always installed)
constexpr int32_t kSsVariant = -150;
constexpr int32_t kSsXml = -152;
constexpr int32_t kSsTime2 = -154;
constexpr int32_t kSsTimestampOffset = -155;

} // anonymous namespace

GenericColumnType OdbcTypeMap::to_generic(int32_t sql_type) {
    static const std::unordered_map<int32_t, GenericColumnType> TYPE_MAP = {
        {SQL_BIT,                GenericColumnType::BOOLEAN},
        {SQL_TINYINT,            GenericColumnType::TINYINT},
        {SQL_SMALLINT,           GenericColumnType::SMALLINT},
        {SQL_INTEGER,            GenericColumnType::INTEGER},
        {SQL_BIGINT,             GenericColumnType::BIGINT},
        {SQL_REAL,               GenericColumnType::REAL},
        {SQL_FLOAT,              GenericColumnType::DOUBLE_PRECISION},
        {SQL_DOUBLE,             GenericColumnType::DOUBLE_PRECISION},
        {SQL_DECIMAL,            GenericColumnType::NUMERIC},
        {SQL_NUMERIC,            GenericColumnType::NUMERIC},
        {SQL_CHAR,               GenericColumnType::CHAR},
        {SQL_WCHAR,              GenericColumnType::CHAR},
        {SQL_VARCHAR,            GenericColumnType::VARCHAR},
        {SQL_WVARCHAR,           GenericColumnType::VARCHAR},
        {SQL_LONGVARCHAR,        GenericColumnType::TEXT},
        {SQL_WLONGVARCHAR,       GenericColumnType::TEXT},
        {SQL_TYPE_DATE,          GenericColumnType::DATE},
        {SQL_TYPE_TIME,          GenericColumnType::TIME},
        {kSsTime2,               GenericColumnType::TIME},
        {SQL_TYPE_TIMESTAMP,     GenericColumnType::TIMESTAMP},
        {kSsTimestampOffset,     GenericColumnType::TIMESTAMP_TZ},
        {SQL_BINARY,             GenericColumnType::BLOB},
        {SQL_VARBINARY,          GenericColumnType::BLOB},
        {SQL_LONGVARBINARY,      GenericColumnType::BLOB},
        {SQL_GUID,               GenericColumnType::UUID},
        {kSsXml,                 GenericColumnType::XML},
        {kSsVariant,             GenericColumnType::VENDOR_SPECIFIC},
    };

    const auto it = TYPE_MAP.find(sql_type);
    return it != TYPE_MAP.end() ? it->second : GenericColumnType::VENDOR_SPECIFIC;
}

ColumnTypeInfo OdbcTypeMap::make_info(int32_t sql_type, std::string type_name) {
    return ColumnTypeInfo(to_generic(sql_type), sql_type, std::move(type_name));
}

} // namespace sqlmcp::odbc
