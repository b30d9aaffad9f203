#include <catch2/catch_test_macros.hpp>
#include "mocks/mock_tool_stack.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace sqlmcp;
using namespace sqlmcp::testing;

namespace {

json call_ok(const ToolRegistry& tools, const std::string& name, const json& args) {
    auto result = tools.call(name, args);
    REQUIRE(result.is_ok());
    return result.value();
}

const json& error_of(const json& tool_result) {
    return tool_result["structuredContent"]["error"];
}

} // anonymous namespace

TEST_CASE("ToolRegistry: lists every tool with a schema", "[tools]") {
    MockToolStack stack;
    const json tools = stack.tools->list_tools();

    REQUIRE(tools.is_array());
    const std::vector<std::string> expected{
        "ping", "list_databases", "list_tables", "list_views", "list_stored_procedures",
        "list_indexes", "list_columns", "list_constraints", "list_foreign_keys",
        "list_dependencies", "run_readonly_query"};
    REQUIRE(tools.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        CHECK(tools[i]["name"] == expected[i]);
        CHECK(tools[i]["description"].is_string());
        CHECK(tools[i]["inputSchema"]["type"] == "object");
        CHECK(stack.tools->has_tool(expected[i]));
    }
    CHECK_FALSE(stack.tools->has_tool("drop_database"));
}

TEST_CASE("ToolRegistry: run_readonly_query schema requires database and query", "[tools]") {
    MockToolStack stack;
    const json tools = stack.tools->list_tools();
    const json& schema = tools.back()["inputSchema"];
    CHECK(schema["required"] == json::array({"database", "query"}));
    CHECK(schema["properties"].contains("max_rows"));
}

TEST_CASE("ToolRegistry: ping answers pong", "[tools]") {
    MockToolStack stack;
    const json result = call_ok(*stack.tools, "ping", json::object());

    CHECK(result["isError"] == false);
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"] == "pong");
    CHECK(result["structuredContent"]["result"] == "pong");
    CHECK(stack.factory->log->databases.empty());
}

TEST_CASE("ToolRegistry: unknown tool is an error result of the call", "[tools]") {
    MockToolStack stack;
    auto result = stack.tools->call("drop_database", json::object());
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INVALID_REQUEST);
    CHECK(result.error_reason() == "unknown-tool");
    CHECK(result.error_message() == "Unknown tool: drop_database");
}

TEST_CASE("ToolRegistry: run_readonly_query returns shaped rows", "[tools]") {
    MockToolStack stack;
    const json result = call_ok(*stack.tools, "run_readonly_query",
        json{{"database", "Sales"}, {"query", "SELECT id, name FROM customers"}, {"max_rows", 2}});

    CHECK(result["isError"] == false);
    const json& payload = result["structuredContent"];
    CHECK(payload["row_count"] == 2);
    CHECK(payload["row_limit"] == 2);
    CHECK(payload["truncated"] == true);
    REQUIRE(payload["rows"].size() == 2);
    CHECK(payload["rows"][0]["id"] == 1);
    CHECK(payload["rows"][0]["name"] == "alice");
    CHECK(payload["rows"][1]["name"].is_null());

    // Text block carries the same JSON
    CHECK(json::parse(result["content"][0]["text"].get<std::string>()) == payload);

    // Column order is preserved on the wire
    CHECK(payload["rows"][0].begin().key() == "id");

    REQUIRE(stack.factory->log->databases.size() == 1);
    CHECK(stack.factory->log->databases[0] == "Sales");
}

TEST_CASE("ToolRegistry: max_rows argument forms", "[tools]") {
    MockToolStack stack(100);
    auto limit_for = [&](const json& max_rows) {
        json args{{"database", "db"}, {"query", "SELECT 1 AS id"}};
        if (!max_rows.is_null()) args["max_rows"] = max_rows;
        const json result = call_ok(*stack.tools, "run_readonly_query", args);
        return result["structuredContent"]["row_limit"].get<int64_t>();
    };

    CHECK(limit_for(nullptr) == 100);
    CHECK(limit_for(10) == 10);
    CHECK(limit_for(1000) == 100);
    CHECK(limit_for(0) == 100);
    CHECK(limit_for(-7) == 100);
    CHECK(limit_for("25") == 25);
    CHECK(limit_for("lots") == 100);
    CHECK(limit_for(2.5) == 100);
    CHECK(limit_for(true) == 100);
    CHECK(limit_for(std::numeric_limits<uint64_t>::max()) == 100);
}

TEST_CASE("ToolRegistry: rejected query is a tool error, not a call error", "[tools]") {
    MockToolStack stack;
    const json result = call_ok(*stack.tools, "run_readonly_query",
        json{{"database", "db"}, {"query", "SELECT * FROM t; DROP TABLE t"}});

    CHECK(result["isError"] == true);
    CHECK(error_of(result)["kind"] == "validation_error");
    CHECK(error_of(result)["reason"] == "multiple-statements");
    CHECK(result["content"][0]["text"] == error_of(result)["message"]);
    CHECK(stack.factory->log->databases.empty());
}

TEST_CASE("ToolRegistry: missing arguments", "[tools]") {
    MockToolStack stack;

    SECTION("query missing") {
        const json result = call_ok(*stack.tools, "run_readonly_query", json{{"database", "db"}});
        CHECK(result["isError"] == true);
        CHECK(error_of(result)["reason"] == "missing-argument");
        CHECK(error_of(result)["message"] == "Missing required argument: query");
    }

    SECTION("database missing") {
        const json result = call_ok(*stack.tools, "run_readonly_query", json{{"query", "SELECT 1"}});
        CHECK(result["isError"] == true);
        CHECK(error_of(result)["kind"] == "invalid_request");
        CHECK(error_of(result)["reason"] == "missing-database");
    }

    SECTION("catalog database missing") {
        const json result = call_ok(*stack.tools, "list_tables", json::object());
        CHECK(result["isError"] == true);
        CHECK(error_of(result)["message"] == "Missing required argument: database");
    }

    SECTION("blank table") {
        const json result = call_ok(*stack.tools, "list_columns",
            json{{"database", "db"}, {"table", "  "}});
        CHECK(error_of(result)["message"] == "Missing required argument: table");
    }

    CHECK(stack.factory->log->databases.empty());
}

TEST_CASE("ToolRegistry: execution failures become tool errors", "[tools]") {
    MockToolStack stack;

    SECTION("timeout") {
        stack.factory->result = make_timeout();
        const json result = call_ok(*stack.tools, "run_readonly_query",
            json{{"database", "db"}, {"query", "SELECT * FROM big"}});
        CHECK(result["isError"] == true);
        CHECK(error_of(result)["kind"] == "execution_error");
        CHECK(error_of(result)["reason"] == "timeout");
    }

    SECTION("connection") {
        stack.factory->fail_connect = true;
        const json result = call_ok(*stack.tools, "list_databases", json::object());
        CHECK(result["isError"] == true);
        CHECK(error_of(result)["kind"] == "connection_error");
        CHECK(error_of(result)["message"] == "Login failed for user 'svc'");
    }
}

TEST_CASE("ToolRegistry: catalog tools return rows under result", "[tools]") {
    MockToolStack stack;
    const json result = call_ok(*stack.tools, "list_tables", json{{"database", "Sales"}});

    CHECK(result["isError"] == false);
    const json& rows = result["structuredContent"]["result"];
    REQUIRE(rows.is_array());
    CHECK(rows.size() == 2);
    CHECK(json::parse(result["content"][0]["text"].get<std::string>()) == rows);
    CHECK(stack.factory->log->databases[0] == "Sales");
}

TEST_CASE("ToolRegistry: catalog tools pass optional filters", "[tools]") {
    MockToolStack stack;
    (void)call_ok(*stack.tools, "list_foreign_keys",
        json{{"database", "Sales"}, {"table", "orders"}, {"schema", "dbo"}});
    const std::vector<std::string> expected{"orders", "dbo"};
    CHECK(stack.factory->log->params.back() == expected);

    (void)call_ok(*stack.tools, "list_dependencies",
        json{{"database", "Sales"}, {"object", "v_orders"}});
    CHECK(stack.factory->log->params.back().size() == 2);
}

TEST_CASE("ToolRegistry: cell values convert to JSON types", "[tools]") {
    CHECK(ToolRegistry::to_json(CellValue{}).is_null());
    CHECK(ToolRegistry::to_json(CellValue{true}) == true);
    CHECK(ToolRegistry::to_json(CellValue{int64_t{42}}) == 42);
    CHECK(ToolRegistry::to_json(CellValue{1.5}) == 1.5);
    CHECK(ToolRegistry::to_json(CellValue{std::string("12.3400")}) == "12.3400");
}
