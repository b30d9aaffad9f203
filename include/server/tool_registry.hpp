#pragma once

#include "catalog/catalog_service.hpp"
#include "core/error.hpp"
#include "core/readonly_query_service.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp {

// Insertion-ordered so rows keep their column order on the wire
using json = nlohmann::ordered_json;

/**
 * @brief The MCP tool surface: definitions, argument parsing, result framing
 *
 * Every tool result has the MCP shape
 *   {"content":[{"type":"text","text":...}], "structuredContent":{...}, "isError":bool}
 * Failures of the underlying operation (rejection, connection, execution)
 * are tool results with isError = true and a structured error object
 * {"kind","reason","message"}; they are not protocol errors.
 */
class ToolRegistry {
public:
    ToolRegistry(std::shared_ptr<const ReadonlyQueryService> queries,
                 std::shared_ptr<const CatalogService> catalog);

    /// Tool definitions for tools/list: name, description, inputSchema
    [[nodiscard]] json list_tools() const;

    /**
     * @brief Invoke a tool by name
     * @return The tool result, or INVALID_REQUEST / "unknown-tool" when no
     *         tool has that name
     */
    [[nodiscard]] Result<json> call(const std::string& name, const json& arguments) const;

    [[nodiscard]] bool has_tool(std::string_view name) const;

    // ---- JSON conversion ---------------------------------------------------

    [[nodiscard]] static json to_json(const CellValue& value);
    [[nodiscard]] static json to_json(const ShapedRow& row);
    [[nodiscard]] static json to_json(const ResultSet& result);
    [[nodiscard]] static json to_json(const std::vector<ShapedRow>& rows);

    /// Successful tool result; the text block is the compact JSON of `text_payload`
    [[nodiscard]] static json success_result(const json& structured, const json& text_payload);

    [[nodiscard]] static json error_result(ErrorCategory category,
                                           const std::string& reason,
                                           const std::string& message);

    template<typename T>
    [[nodiscard]] static json error_result(const Result<T>& failed) {
        return error_result(failed.error_category(), failed.error_reason(), failed.error_message());
    }

private:
    struct Tool {
        std::string name;
        std::string description;
        json input_schema;
        std::function<json(const json&)> handler;
    };

    void register_tools();

    std::shared_ptr<const ReadonlyQueryService> queries_;
    std::shared_ptr<const CatalogService> catalog_;
    std::vector<Tool> tools_;
};

} // namespace sqlmcp
