#include <catch2/catch_test_macros.hpp>
#include "mocks/mock_tool_stack.hpp"
#include "server/http_server.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace sqlmcp;
using namespace sqlmcp::testing;

namespace {

ServerConfig http_config(size_t workers = 2, size_t max_queue = 8) {
    ServerConfig cfg;
    cfg.transport = Transport::HTTP;
    cfg.host = "127.0.0.1";
    cfg.port = 18080;
    cfg.workers = workers;
    cfg.max_queue = max_queue;
    return cfg;
}

std::shared_ptr<ShutdownCoordinator> make_shutdown() {
    ShutdownCoordinator::Config cfg;
    cfg.shutdown_timeout = std::chrono::milliseconds(2000);
    return std::make_shared<ShutdownCoordinator>(cfg);
}

const std::string kSlowQuery =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"run_readonly_query",)"
    R"("arguments":{"database":"db","query":"SELECT 1 AS id"}}})";

} // anonymous namespace

TEST_CASE("HttpServer: request gets 200 with the JSON-RPC response", "[http]") {
    MockToolStack stack;
    HttpServer server(stack.dispatcher, http_config(), make_shutdown());

    const auto reply = server.handle_message(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    CHECK(reply.status == 200);
    const json body = json::parse(reply.body);
    CHECK(body["id"] == 1);
    CHECK(body["result"] == json::object());
}

TEST_CASE("HttpServer: notification gets 202 with no body", "[http]") {
    MockToolStack stack;
    HttpServer server(stack.dispatcher, http_config(), make_shutdown());

    const auto reply = server.handle_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    CHECK(reply.status == 202);
    CHECK(reply.body.empty());
}

TEST_CASE("HttpServer: malformed body gets 400 with a JSON-RPC error", "[http]") {
    MockToolStack stack;
    HttpServer server(stack.dispatcher, http_config(), make_shutdown());

    const auto reply = server.handle_message("{oops");
    CHECK(reply.status == 400);
    CHECK(json::parse(reply.body)["error"]["code"] == mcp::kParseError);
}

TEST_CASE("HttpServer: tool call round trip", "[http]") {
    MockToolStack stack;
    HttpServer server(stack.dispatcher, http_config(), make_shutdown());

    const auto reply = server.handle_message(kSlowQuery);
    REQUIRE(reply.status == 200);
    const json body = json::parse(reply.body);
    CHECK(body["result"]["structuredContent"]["row_count"] == 2);
}

TEST_CASE("HttpServer: refuses requests once shutdown starts", "[http]") {
    MockToolStack stack;
    auto shutdown = make_shutdown();
    HttpServer server(stack.dispatcher, http_config(), shutdown);
    shutdown->initiate_shutdown();

    const auto reply = server.handle_message(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    CHECK(reply.status == 503);
    const json body = json::parse(reply.body);
    CHECK(body["error"]["code"] == mcp::kServerBusy);
    CHECK(body["error"]["message"] == "server shutting down");
}

TEST_CASE("HttpServer: full queue answers 503 server busy", "[http]") {
    MockToolStack stack;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    auto started_future = started.get_future();
    std::atomic<bool> first{true};
    stack.factory->before_execute = [&, gate] {
        if (first.exchange(false)) started.set_value();
        gate.wait();
    };

    auto shutdown = make_shutdown();
    HttpServer server(stack.dispatcher, http_config(1, 1), shutdown);

    // First request occupies the only worker
    auto running = std::async(std::launch::async, [&] { return server.handle_message(kSlowQuery); });
    started_future.wait();

    // Second request waits in the queue
    auto queued = std::async(std::launch::async, [&] { return server.handle_message(kSlowQuery); });
    while (shutdown->in_flight_count() < 2) {
        std::this_thread::yield();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto refused = server.handle_message(R"({"jsonrpc":"2.0","id":7,"method":"ping"})");
    CHECK(refused.status == 503);
    const json body = json::parse(refused.body);
    CHECK(body["id"] == 7);
    CHECK(body["error"]["message"] == "server busy");
    CHECK(server.busy_rejects() == 1);

    release.set_value();
    CHECK(running.get().status == 200);
    CHECK(queued.get().status == 200);
}
