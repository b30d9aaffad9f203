#include "executor/result_shaper.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>

namespace sqlmcp {

namespace {

ShapedRow zip_row(const std::vector<std::string>& columns,
                  const std::vector<ColumnTypeInfo>& column_types,
                  std::vector<DbCell>& values) {
    static const ColumnTypeInfo kUntyped{GenericColumnType::TEXT, 0, ""};

    ShapedRow row;
    row.reserve(columns.size());
    const size_t n = std::min(columns.size(), values.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& type = i < column_types.size() ? column_types[i] : kUntyped;
        CellValue value = ResultShaper::to_cell(values[i], type);

        auto existing = std::find_if(row.begin(), row.end(),
            [&](const auto& entry) { return entry.first == columns[i]; });
        if (existing != row.end()) {
            existing->second = std::move(value);
        } else {
            row.emplace_back(columns[i], std::move(value));
        }
    }
    return row;
}

} // anonymous namespace

CellValue ResultShaper::to_cell(const DbCell& cell, const ColumnTypeInfo& type) {
    if (!cell) {
        return std::monostate{};
    }
    const std::string& text = *cell;

    if (type.generic_type == GenericColumnType::BOOLEAN) {
        if (text == "1") return true;
        if (text == "0") return false;
        return utils::parse_bool(text);
    }

    if (is_integer_type(type.generic_type)) {
        if (auto v = utils::try_parse_int<int64_t>(text)) {
            return *v;
        }
        return text;
    }

    if (is_floating_type(type.generic_type)) {
        double d = 0.0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return d;
        }
        return text;
    }

    return text;
}

ResultSet ResultShaper::shape(const std::vector<std::string>& columns,
                              const std::vector<ColumnTypeInfo>& column_types,
                              std::vector<std::vector<DbCell>> rows,
                              uint32_t limit) {
    ResultSet result;
    result.rows.reserve(rows.size());
    for (auto& values : rows) {
        result.rows.push_back(zip_row(columns, column_types, values));
    }
    result.row_count = static_cast<uint32_t>(result.rows.size());
    result.row_limit = limit;
    result.truncated = result.row_count >= limit;
    return result;
}

ResultSet ResultShaper::shape(const std::vector<std::string>& columns,
                              std::vector<std::vector<DbCell>> rows,
                              uint32_t limit) {
    return shape(columns, {}, std::move(rows), limit);
}

std::vector<ShapedRow> ResultShaper::shape_rows(const DbResultSet& result) {
    std::vector<ShapedRow> rows;
    rows.reserve(result.rows.size());
    for (auto values : result.rows) {
        rows.push_back(zip_row(result.column_names, result.column_types, values));
    }
    return rows;
}

} // namespace sqlmcp
