#include <catch2/catch_test_macros.hpp>
#include "executor/query_executor.hpp"
#include "mocks/mock_connection.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace sqlmcp;
using namespace sqlmcp::testing;

namespace {

struct ExecutorFixture {
    ExecutionPolicy policy;
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>();
    std::vector<bool> released_reusable;

    QueryExecutor make_executor(bool track_release = false) {
        if (!track_release) {
            return QueryExecutor(factory, policy);
        }
        return QueryExecutor(factory, policy,
            [this](std::unique_ptr<IDbConnection> conn, bool reusable) {
                released_reusable.push_back(reusable);
                conn->close();
            });
    }
};

} // anonymous namespace

TEST_CASE("QueryExecutor: guard batch wraps the verbatim query", "[executor]") {
    CHECK(QueryExecutor::build_guarded_batch("SELECT * FROM t", 25) ==
          "SET NOCOUNT ON;\nSET ROWCOUNT 25;\nSELECT * FROM t");
}

TEST_CASE("QueryExecutor: sends one guarded batch on the requested database", "[executor]") {
    ExecutorFixture fx;
    fx.policy.query_timeout_seconds = 12;
    fx.factory->result = make_rows({"id"}, {{DbCell("1")}, {DbCell("2")}}, {int_type()});
    auto executor = fx.make_executor();

    auto result = executor.execute("Sales", "SELECT id FROM orders", 2);

    REQUIRE(result.is_ok());
    CHECK(result.value().row_count == 2);
    CHECK(result.value().row_limit == 2);
    CHECK(result.value().truncated);

    const auto& log = *fx.factory->log;
    REQUIRE(log.databases.size() == 1);
    CHECK(log.databases[0] == "Sales");
    REQUIRE(log.statements.size() == 1);
    CHECK(log.statements[0] == "SET NOCOUNT ON;\nSET ROWCOUNT 2;\nSELECT id FROM orders");
    CHECK(log.params[0].empty());
    REQUIRE(log.timeouts.size() == 1);
    CHECK(log.timeouts[0] == 12);
}

TEST_CASE("QueryExecutor: session is released after success", "[executor]") {
    ExecutorFixture fx;
    fx.factory->result = make_rows({"a"}, {});
    auto executor = fx.make_executor(true);

    REQUIRE(executor.execute("db", "SELECT 1 AS a", 10).is_ok());

    REQUIRE(fx.released_reusable.size() == 1);
    CHECK(fx.released_reusable[0]);
    CHECK(fx.factory->log->closed == 1);
    CHECK(executor.get_stats().executed == 1);
}

TEST_CASE("QueryExecutor: connection failure is a connection error", "[executor]") {
    ExecutorFixture fx;
    fx.factory->fail_connect = true;
    auto executor = fx.make_executor();

    auto result = executor.execute("db", "SELECT 1", 10);

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONNECTION_ERROR);
    CHECK(result.error_message() == "Login failed for user 'svc'");
    CHECK(fx.factory->log->statements.empty());
    CHECK(executor.get_stats().failed == 1);
}

TEST_CASE("QueryExecutor: timeout discards the session", "[executor]") {
    ExecutorFixture fx;
    fx.policy.query_timeout_seconds = 5;
    fx.factory->result = make_timeout();
    auto executor = fx.make_executor(true);

    auto result = executor.execute("db", "SELECT * FROM big", 10);

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    CHECK(result.error_reason() == "timeout");
    CHECK(result.error_message() == "Query exceeded the 5 second timeout");

    REQUIRE(fx.released_reusable.size() == 1);
    CHECK_FALSE(fx.released_reusable[0]);
    CHECK(fx.factory->log->closed == 1);
    CHECK(executor.get_stats().timeouts == 1);
}

TEST_CASE("QueryExecutor: engine error carries the driver message", "[executor]") {
    ExecutorFixture fx;
    fx.factory->result = make_failure("[42S02] (208) Invalid object name 'nope'.");
    auto executor = fx.make_executor();

    auto result = executor.execute("db", "SELECT * FROM nope", 10);

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    CHECK(result.error_reason() == "statement");
    CHECK(result.error_message() == "[42S02] (208) Invalid object name 'nope'.");
    CHECK(fx.factory->log->closed == 1);
}

TEST_CASE("QueryExecutor: driver exception becomes an execution error", "[executor]") {
    ExecutorFixture fx;
    fx.factory->throw_on_execute = true;
    auto executor = fx.make_executor(true);

    auto result = executor.execute("db", "SELECT 1", 10);

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    CHECK(result.error_reason() == "statement");
    CHECK(result.error_message() == "Database error: driver exploded");
    REQUIRE(fx.released_reusable.size() == 1);
    CHECK_FALSE(fx.released_reusable[0]);
}

TEST_CASE("QueryExecutor: failure to apply the timeout stops before executing", "[executor]") {
    ExecutorFixture fx;
    fx.factory->timeout_ok = false;
    auto executor = fx.make_executor();

    auto result = executor.execute("db", "SELECT 1", 10);

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    CHECK(result.error_message() == "Failed to apply statement timeout");
    CHECK(fx.factory->log->statements.empty());
    CHECK(fx.factory->log->closed == 1);
}

TEST_CASE("ScopedConnection: closes on scope exit without a callback", "[executor]") {
    auto log = std::make_shared<MockSessionLog>();
    {
        ScopedConnection conn(std::make_unique<MockConnection>(log, DbResultSet{}, true, false));
        CHECK(conn.is_valid());
    }
    CHECK(log->closed == 1);
}

TEST_CASE("ScopedConnection: move transfers ownership", "[executor]") {
    auto log = std::make_shared<MockSessionLog>();
    int releases = 0;
    auto release = [&](std::unique_ptr<IDbConnection> conn, bool) {
        ++releases;
        conn->close();
    };
    {
        ScopedConnection a(std::make_unique<MockConnection>(log, DbResultSet{}, true, false), release);
        ScopedConnection b(std::move(a));
        CHECK(a.get() == nullptr);
        CHECK(b.get() != nullptr);
    }
    CHECK(releases == 1);
}

TEST_CASE("ScopedConnection: discard releases immediately as not reusable", "[executor]") {
    auto log = std::make_shared<MockSessionLog>();
    std::vector<bool> reusable;
    ScopedConnection conn(std::make_unique<MockConnection>(log, DbResultSet{}, true, false),
        [&](std::unique_ptr<IDbConnection>, bool r) { reusable.push_back(r); });

    conn.discard();

    CHECK(conn.discarded());
    CHECK(conn.get() == nullptr);
    REQUIRE(reusable.size() == 1);
    CHECK_FALSE(reusable[0]);
    CHECK(log->closed == 1);
}
