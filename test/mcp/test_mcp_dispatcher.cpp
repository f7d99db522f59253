#include <catch2/catch_test_macros.hpp>

#include <kmcp/mcp/mcp_dispatcher.hpp>
#include <kmcp/tools/echo_tool.hpp>

#include "mocks/mock_tool_handler.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace kmcp;
using kmcp::testing::ThrowingToolHandler;

namespace {

std::shared_ptr<const ToolRegistry> MakeTestRegistry() {
    auto registry = std::make_shared<ToolRegistry>();
    REQUIRE(RegisterEchoTool(*registry, nlohmann::json::object()).IsOk());
    REQUIRE(registry->Register(ToolDescriptor{"explode", "Always throws",
                                              kmcp::testing::ObjectSchema()},
                               std::make_shared<ThrowingToolHandler>("boom")).IsOk());
    return registry;
}

struct Fixture {
    ServerContext context{ServerInfo{"test-server", "1.0.0"}, MakeTestRegistry()};
    McpDispatcher dispatcher{context};

    nlohmann::json Call(const nlohmann::json& msg) {
        return nlohmann::json::parse(dispatcher.HandleMessage(msg.dump()));
    }
};

} // anonymous namespace

// ===========================================================================
// initialize
// ===========================================================================

TEST_CASE("McpDispatcher: initialize returns capabilities", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "initialize"},
        {"params", {{"protocolVersion", "2024-11-05"}}}
    });

    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["capabilities"]["tools"] == nlohmann::json::object());
    CHECK(r["result"]["serverInfo"]["name"] == "test-server");
    CHECK(r["result"]["serverInfo"]["version"] == "1.0.0");
    CHECK_FALSE(r.contains("error"));
}

TEST_CASE("McpDispatcher: initialize without params", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", "init"}, {"method", "initialize"}});
    CHECK(r["id"] == "init");
    CHECK(r["result"]["protocolVersion"] == kProtocolVersion);
}

TEST_CASE("McpDispatcher: initialize with non-object params", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                     {"params", nlohmann::json::array({1, 2})}});
    CHECK(r["error"]["code"] == kInvalidParams);
}

// ===========================================================================
// tools/list
// ===========================================================================

TEST_CASE("McpDispatcher: tools/list returns registered tools", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});

    auto& tools = r["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo a message back to the client.");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
    CHECK(tools[0]["inputSchema"]["required"][0] == "message");
    CHECK(tools[1]["name"] == "explode");
}

TEST_CASE("McpDispatcher: tools/list is stable across calls", "[mcp][dispatcher]") {
    Fixture f;
    auto first = f.Call({{"jsonrpc", "2.0"}, {"id", 10}, {"method", "tools/list"}});
    auto second = f.Call({{"jsonrpc", "2.0"}, {"id", "again"}, {"method", "tools/list"}});

    CHECK(first["id"] == 10);
    CHECK(second["id"] == "again");
    CHECK(first["result"] == second["result"]);

    auto& tools = second["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[1]["name"] == "explode");
}

TEST_CASE("ToolsListResult: empty registry", "[mcp][dispatcher]") {
    ToolRegistry registry;
    auto result = ToolsListResult(registry);
    CHECK(result == nlohmann::json{{"tools", nlohmann::json::array()}});
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpDispatcher: tools/call echo exact bytes", "[mcp][dispatcher]") {
    Fixture f;
    auto out = f.dispatcher.HandleMessage(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
    CHECK(out ==
          R"({"jsonrpc":"2.0","id":1,"result":{"content":[{"type":"text","text":"{\"result\":\"hi\"}"}],"isError":false}})");
}

TEST_CASE("McpDispatcher: tools/call tool-level failure", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                     {"params", {{"name", "echo"}, {"arguments", nlohmann::json::object()}}}});

    CHECK_FALSE(r.contains("error"));
    CHECK(r["result"]["isError"] == true);
    CHECK(r["result"]["content"][0]["text"] == "Error: Missing required parameter: message");
}

TEST_CASE("McpDispatcher: tools/call without arguments", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                     {"params", {{"name", "echo"}}}});
    CHECK(r["result"]["isError"] == true);
}

TEST_CASE("McpDispatcher: tools/call unknown tool", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                     {"params", {{"name", "nope"}, {"arguments", nlohmann::json::object()}}}});

    CHECK(r["id"] == 4);
    CHECK(r["error"]["code"] == -32602);
    CHECK(r["error"]["message"] == "Unknown tool: nope");
    CHECK_FALSE(r.contains("result"));
}

TEST_CASE("McpDispatcher: tools/call missing name", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                     {"params", {{"arguments", nlohmann::json::object()}}}});
    CHECK(r["error"]["code"] == kInvalidParams);
    CHECK(r["error"]["data"] == "Missing 'name' parameter");
}

TEST_CASE("McpDispatcher: tools/call bad params shapes", "[mcp][dispatcher]") {
    Fixture f;

    SECTION("params absent") {
        auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"}});
        CHECK(r["error"]["code"] == kInvalidParams);
    }
    SECTION("name not a string") {
        auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"},
                         {"params", {{"name", 12}}}});
        CHECK(r["error"]["code"] == kInvalidParams);
    }
    SECTION("arguments not an object") {
        auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"},
                         {"params", {{"name", "echo"}, {"arguments", "hi"}}}});
        CHECK(r["error"]["code"] == kInvalidParams);
        CHECK(r["error"]["data"] == "'arguments' must be an object");
    }
}

TEST_CASE("McpDispatcher: throwing tool yields internal error", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
                     {"params", {{"name", "explode"}}}});
    CHECK(r["error"]["code"] == kInternalError);

    // Subsequent requests are unaffected.
    auto next = f.Call({{"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/list"}});
    CHECK(next["result"]["tools"].size() == 2);
}

// ===========================================================================
// Routing and protocol errors
// ===========================================================================

TEST_CASE("McpDispatcher: unknown method exact bytes", "[mcp][dispatcher]") {
    Fixture f;
    auto out = f.dispatcher.HandleMessage(R"({"jsonrpc":"2.0","id":9,"method":"resources/list"})");
    CHECK(out == R"({"jsonrpc":"2.0","id":9,"error":{"code":-32601,"message":"Method not found"}})");
}

TEST_CASE("McpDispatcher: initialized notification is acknowledged", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.Call({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK(r["id"].is_null());
    CHECK(r["result"] == nlohmann::json::object());
}

TEST_CASE("McpDispatcher: parse error", "[mcp][dispatcher]") {
    Fixture f;
    auto r = nlohmann::json::parse(f.dispatcher.HandleMessage("{broken"));
    CHECK(r["id"].is_null());
    CHECK(r["error"]["code"] == kParseError);
    CHECK(r["error"]["message"] == "Parse error");
}

TEST_CASE("McpDispatcher: invalid request echoes the id", "[mcp][dispatcher]") {
    Fixture f;
    auto r = nlohmann::json::parse(
        f.dispatcher.HandleMessage(R"({"jsonrpc":"1.0","id":11,"method":"initialize"})"));
    CHECK(r["id"] == 11);
    CHECK(r["error"]["code"] == kInvalidRequest);
}

TEST_CASE("McpDispatcher: id echoed verbatim", "[mcp][dispatcher]") {
    Fixture f;
    CHECK(f.Call({{"jsonrpc", "2.0"}, {"id", "req-1"}, {"method", "tools/list"}})["id"] == "req-1");
    CHECK(f.Call({{"jsonrpc", "2.0"}, {"id", 2.5}, {"method", "tools/list"}})["id"] == 2.5);
    CHECK(f.Call({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "tools/list"}})["id"].is_null());
}

// ===========================================================================
// Metrics / concurrency
// ===========================================================================

TEST_CASE("McpDispatcher: metrics count requests, tool calls and errors", "[mcp][dispatcher]") {
    Fixture f;
    (void)f.dispatcher.HandleMessage(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    (void)f.dispatcher.HandleMessage(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"x"}}})");
    (void)f.dispatcher.HandleMessage("garbage");

    const auto& m = f.context.Metrics();
    CHECK(m.RequestsTotal() == 3);
    CHECK(m.ToolCallsTotal() == 1);
    CHECK(m.ErrorsTotal() == 1);

    auto snapshot = m.Snapshot();
    CHECK(snapshot["requests_total"] == 3);
    CHECK(snapshot["status"] == "ok");
}

TEST_CASE("McpDispatcher: concurrent requests get their own ids", "[mcp][dispatcher]") {
    Fixture f;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    std::vector<int> mismatches(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&f, &mismatches, t] {
            for (int i = 0; i < kPerThread; ++i) {
                int id = t * 1000 + i;
                nlohmann::json msg = {
                    {"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                    {"params", {{"name", "echo"},
                                {"arguments", {{"message", std::to_string(id)}}}}}};
                auto r = nlohmann::json::parse(f.dispatcher.HandleMessage(msg.dump()));
                auto text = r["result"]["content"][0]["text"].get<std::string>();
                if (r["id"] != id || nlohmann::json::parse(text)["result"] != std::to_string(id)) {
                    ++mismatches[t];
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    for (int count : mismatches) {
        CHECK(count == 0);
    }
    CHECK(f.context.Metrics().RequestsTotal() == kThreads * kPerThread);
}

TEST_CASE("ServerContext: null registry is rejected", "[mcp][dispatcher]") {
    CHECK_THROWS_AS(ServerContext(ServerInfo{"x", "1"}, nullptr), std::invalid_argument);
}
