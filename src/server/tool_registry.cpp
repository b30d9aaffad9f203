#include "server/tool_registry.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <type_traits>
#include <variant>

namespace sqlmcp {

namespace {

constexpr const char* kDatabase = "database";
constexpr const char* kQuery     = "query";
constexpr const char* kMaxRows   = "max_rows";
constexpr const char* kTable     = "table";
constexpr const char* kSchema    = "schema";
constexpr const char* kObject    = "object";

std::string dump(const json& j) {
    // Driver text is not guaranteed to be valid UTF-8
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---- Schema helpers --------------------------------------------------------

json string_prop(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

json object_schema(json properties, const std::vector<std::string>& required = {}) {
    json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

json database_only_schema() {
    return object_schema(
        json{{kDatabase, string_prop("Database (catalog) to inspect")}},
        {kDatabase});
}

// ---- Argument helpers ------------------------------------------------------

// nullopt when absent, null, not a string, or blank
std::optional<std::string> string_arg(const json& args, const char* key) {
    if (!args.is_object()) return std::nullopt;
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (utils::trim_left(value).empty()) return std::nullopt;
    return value;
}

/**
 * @brief Requested row cap as sent by the caller
 *
 * Integers pass through (unsigned overflow clamps), numeric strings are
 * parsed, everything else (float, bool, garbage) is treated as absent and
 * resolves to the policy ceiling downstream.
 */
std::optional<int64_t> max_rows_arg(const json& args) {
    if (!args.is_object()) return std::nullopt;
    const auto it = args.find(kMaxRows);
    if (it == args.end()) return std::nullopt;

    if (it->is_number_unsigned()) {
        const auto u = it->get<uint64_t>();
        constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        return u > kMax ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(u);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        return utils::try_parse_int<int64_t>(utils::trim_right(utils::trim_left(s)));
    }
    return std::nullopt;
}

json missing_argument(const char* name) {
    return ToolRegistry::error_result(ErrorCategory::INVALID_REQUEST, "missing-argument",
        std::format("Missing required argument: {}", name));
}

json rows_result(const Result<std::vector<ShapedRow>>& result) {
    if (result.is_error()) {
        return ToolRegistry::error_result(result);
    }
    const json rows = ToolRegistry::to_json(result.value());
    return ToolRegistry::success_result(json{{"result", rows}}, rows);
}

} // anonymous namespace

// ============================================================================
// Construction / registration
// ============================================================================

ToolRegistry::ToolRegistry(std::shared_ptr<const ReadonlyQueryService> queries,
                           std::shared_ptr<const CatalogService> catalog)
    : queries_(std::move(queries)), catalog_(std::move(catalog)) {
    register_tools();
}

void ToolRegistry::register_tools() {
    tools_.push_back({
        "ping",
        "Health check to verify the MCP server is running.",
        object_schema(json::object()),
        [](const json&) {
            return success_result(json{{"result", "pong"}}, json("pong"));
        }
    });

    tools_.push_back({
        "list_databases",
        "List databases visible to the configured login on the SQL Server instance.",
        object_schema(json::object()),
        [this](const json&) {
            return rows_result(catalog_->list_databases());
        }
    });

    tools_.push_back({
        "list_tables",
        "List tables in the specified database. Returns schema, table name, "
        "and creation/modification metadata.",
        database_only_schema(),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            return rows_result(catalog_->list_tables(*db));
        }
    });

    tools_.push_back({
        "list_views",
        "List views in the specified database along with schema and timestamps.",
        database_only_schema(),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            return rows_result(catalog_->list_views(*db));
        }
    });

    tools_.push_back({
        "list_stored_procedures",
        "List stored procedures in the specified database with metadata.",
        database_only_schema(),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            return rows_result(catalog_->list_stored_procedures(*db));
        }
    });

    tools_.push_back({
        "list_indexes",
        "List indexes for tables in the specified database.",
        database_only_schema(),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            return rows_result(catalog_->list_indexes(*db));
        }
    });

    tools_.push_back({
        "list_columns",
        "List the columns of a table or view with type, size, nullability and identity flags.",
        object_schema(json{
            {kDatabase, string_prop("Database (catalog) to inspect")},
            {kTable, string_prop("Table or view name")},
            {kSchema, string_prop("Schema name; all schemas when omitted")}
        }, {kDatabase, kTable}),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            const auto table = string_arg(args, kTable);
            if (!table) return missing_argument(kTable);
            return rows_result(catalog_->list_columns(*db, *table, string_arg(args, kSchema)));
        }
    });

    tools_.push_back({
        "list_constraints",
        "List primary key, unique, foreign key, check and default constraints of a table.",
        object_schema(json{
            {kDatabase, string_prop("Database (catalog) to inspect")},
            {kTable, string_prop("Table name")},
            {kSchema, string_prop("Schema name; all schemas when omitted")}
        }, {kDatabase, kTable}),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            const auto table = string_arg(args, kTable);
            if (!table) return missing_argument(kTable);
            return rows_result(catalog_->list_constraints(*db, *table, string_arg(args, kSchema)));
        }
    });

    tools_.push_back({
        "list_foreign_keys",
        "List foreign key column pairs, optionally limited to one referencing table.",
        object_schema(json{
            {kDatabase, string_prop("Database (catalog) to inspect")},
            {kTable, string_prop("Referencing table name; all tables when omitted")},
            {kSchema, string_prop("Referencing schema name; all schemas when omitted")}
        }, {kDatabase}),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            return rows_result(catalog_->list_foreign_keys(
                *db, string_arg(args, kTable), string_arg(args, kSchema)));
        }
    });

    tools_.push_back({
        "list_dependencies",
        "List the objects a view, procedure or function references, and the objects "
        "that reference it.",
        object_schema(json{
            {kDatabase, string_prop("Database (catalog) to inspect")},
            {kObject, string_prop("Object name")},
            {kSchema, string_prop("Schema name; all schemas when omitted")}
        }, {kDatabase, kObject}),
        [this](const json& args) {
            const auto db = string_arg(args, kDatabase);
            if (!db) return missing_argument(kDatabase);
            const auto object = string_arg(args, kObject);
            if (!object) return missing_argument(kObject);
            return rows_result(catalog_->list_dependencies(*db, *object, string_arg(args, kSchema)));
        }
    });

    const auto& policy = queries_->policy();
    tools_.push_back({
        "run_readonly_query",
        std::format(
            "Run a single read-only SELECT (or WITH ... SELECT) statement against a database. "
            "Comments and string literals are ignored when checking the statement; data-modifying "
            "keywords and xp_/sp_ procedure calls are rejected. Returns at most max_rows rows "
            "(default and ceiling {}); the statement is cancelled after {} seconds. "
            "'truncated' is true when the row cap was reached, which means more rows may exist.",
            policy.max_rows, policy.query_timeout_seconds),
        object_schema(json{
            {kDatabase, string_prop("Database (catalog) to query")},
            {kQuery, string_prop("A single SELECT or WITH statement")},
            {kMaxRows, json{
                {"type", json::array({"integer", "string"})},
                {"description", std::format("Row cap; values <= 0 or above {} use {}",
                                            policy.max_rows, policy.max_rows)}
            }}
        }, {kDatabase, kQuery}),
        [this](const json& args) {
            QueryRequest request;
            if (args.is_object()) {
                if (const auto it = args.find(kDatabase); it != args.end() && it->is_string()) {
                    request.database = it->get<std::string>();
                }
                const auto it = args.find(kQuery);
                if (it == args.end() || !it->is_string()) {
                    return missing_argument(kQuery);
                }
                request.query = it->get<std::string>();
            } else {
                return missing_argument(kQuery);
            }
            request.max_rows = max_rows_arg(args);

            const auto result = queries_->run(request);
            if (result.is_error()) {
                return error_result(result);
            }
            const json payload = to_json(result.value());
            return success_result(payload, payload);
        }
    });
}

// ============================================================================
// Dispatch
// ============================================================================

json ToolRegistry::list_tools() const {
    json tools = json::array();
    for (const auto& tool : tools_) {
        tools.push_back(json{
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return tools;
}

bool ToolRegistry::has_tool(std::string_view name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) return true;
    }
    return false;
}

Result<json> ToolRegistry::call(const std::string& name, const json& arguments) const {
    for (const auto& tool : tools_) {
        if (tool.name != name) continue;

        try {
            return Result<json>::ok(tool.handler(arguments));
        } catch (const std::exception& e) {
            utils::log::error(std::format("Tool '{}' raised: {}", name, e.what()));
            return Result<json>::ok(error_result(ErrorCategory::INTERNAL_ERROR, "internal",
                std::format("Internal error: {}", e.what())));
        }
    }
    return Result<json>::error(ErrorCategory::INVALID_REQUEST,
        std::format("Unknown tool: {}", name), "unknown-tool");
}

// ============================================================================
// JSON conversion
// ============================================================================

json ToolRegistry::to_json(const CellValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

json ToolRegistry::to_json(const ShapedRow& row) {
    json obj = json::object();
    for (const auto& [column, value] : row) {
        obj[column] = to_json(value);
    }
    return obj;
}

json ToolRegistry::to_json(const std::vector<ShapedRow>& rows) {
    json arr = json::array();
    for (const auto& row : rows) {
        arr.push_back(to_json(row));
    }
    return arr;
}

json ToolRegistry::to_json(const ResultSet& result) {
    return json{
        {"rows", to_json(result.rows)},
        {"row_count", result.row_count},
        {"row_limit", result.row_limit},
        {"truncated", result.truncated}
    };
}

json ToolRegistry::success_result(const json& structured, const json& text_payload) {
    const std::string text = text_payload.is_string()
        ? text_payload.get<std::string>()
        : dump(text_payload);
    return json{
        {"content", json::array({json{{"type", "text"}, {"text", text}}})},
        {"structuredContent", structured},
        {"isError", false}
    };
}

json ToolRegistry::error_result(ErrorCategory category,
                                const std::string& reason,
                                const std::string& message) {
    return json{
        {"content", json::array({json{{"type", "text"}, {"text", message}}})},
        {"structuredContent", json{
            {"error", json{
                {"kind", error_category_to_string(category)},
                {"reason", reason},
                {"message", message}
            }}
        }},
        {"isError", true}
    };
}

} // namespace sqlmcp
