#include <catch2/catch_test_macros.hpp>
#include "mock_transport.hpp"
#include "mcp_client.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using namespace tether;
using json = nlohmann::json;

static json flight_tools() {
    return json::parse(R"({"tools": [
        {
            "name": "search_flights",
            "description": "Search for airline tickets",
            "inputSchema": {
                "type": "object",
                "properties": {
                    "origin": {"type": "string"},
                    "destination": {"type": "string"},
                    "departure_date": {"type": "string"},
                    "return_date": {"type": "string"}
                },
                "required": ["origin", "destination", "departure_date"]
            }
        },
        {
            "name": "get_weather",
            "description": "Current weather for a city",
            "inputSchema": {
                "type": "object",
                "properties": {"city": {"type": "string"}},
                "required": ["city"]
            }
        }
    ]})");
}

static json text_content(const std::string& text) {
    return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

// Client that has completed the handshake against `t`
static McpClient ready_client(MockTransport& t) {
    t.push_handshake(1);
    McpClient client(t);
    std::string err;
    REQUIRE(client.initialize(&err));
    t.sent.clear();
    return client;
}

// ── initialize ───────────────────────────────────────────────────

TEST_CASE("McpClient::initialize: sends request then initialized notification", "[mcp]") {
    MockTransport t;
    t.push_handshake(1);
    McpClient client(t, ClientIdentity{"2024-11-05", "tether-test", "0.0.1"});

    std::string err;
    REQUIRE(client.initialize(&err));
    REQUIRE(client.initialized());

    REQUIRE(t.sent.size() == 2);
    const auto& req = t.sent[0];
    REQUIRE(req["jsonrpc"] == "2.0");
    REQUIRE(req["id"] == 1);
    REQUIRE(req["method"] == "initialize");
    REQUIRE(req["params"]["protocolVersion"] == "2024-11-05");
    REQUIRE(req["params"]["capabilities"].is_object());
    REQUIRE(req["params"]["clientInfo"]["name"] == "tether-test");
    REQUIRE(req["params"]["clientInfo"]["version"] == "0.0.1");

    const auto& note = t.sent[1];
    REQUIRE(note["method"] == "notifications/initialized");
    REQUIRE_FALSE(note.contains("id"));
}

TEST_CASE("McpClient::initialize: error reply fails with server message", "[mcp]") {
    MockTransport t;
    t.push_error(1, -32602, "Unsupported protocol version");
    McpClient client(t);

    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE_FALSE(client.initialized());
    REQUIRE(err == "initialize failed: Unsupported protocol version");
    REQUIRE(t.sent.size() == 1); // no notification after a failed handshake
}

TEST_CASE("McpClient::initialize: closed stream fails", "[mcp]") {
    MockTransport t;
    McpClient client(t);
    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE(err.find("no response to initialize") != std::string::npos);
}

TEST_CASE("McpClient::initialize: reply without result fails", "[mcp]") {
    MockTransport t;
    t.push({{"jsonrpc", "2.0"}, {"id", 1}});
    McpClient client(t);

    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE_FALSE(client.initialized());
    REQUIRE(err == "initialize response has no result");
    REQUIRE(t.sent.size() == 1);
}

TEST_CASE("McpClient::initialize: null result fails", "[mcp]") {
    MockTransport t;
    t.push({{"jsonrpc", "2.0"}, {"id", 1}, {"result", nullptr}});
    McpClient client(t);

    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE(err == "initialize response has no result");
}

TEST_CASE("McpClient::initialize: broken pipe fails", "[mcp]") {
    MockTransport t;
    t.write_ok = false;
    McpClient client(t);
    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE(err.find("pipe closed") != std::string::npos);
}

// ── Correlation ──────────────────────────────────────────────────

TEST_CASE("McpClient: skips noise while waiting for its reply", "[mcp]") {
    MockTransport t;
    t.push_garbage("Server starting on stdio...");
    t.push({{"jsonrpc", "2.0"}, {"method", "notifications/message"},
            {"params", {{"level", "info"}}}});
    t.push({{"jsonrpc", "2.0"}, {"id", 99}, {"method", "roots/list"}});
    t.push_result(42, json::object()); // stale id
    t.push_handshake(1);

    McpClient client(t);
    std::string err;
    REQUIRE(client.initialize(&err));
    REQUIRE(t.incoming.empty());
}

TEST_CASE("McpClient: garbled reply fails the request instead of waiting", "[mcp]") {
    MockTransport t;
    t.push_garbage(R"({"jsonrpc":"2.0","id":1,"result":{trunc)");
    t.push_handshake(1); // must not be reached

    McpClient client(t);
    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE(err.find("malformed reply from tool server") != std::string::npos);
    REQUIRE(t.incoming.size() == 1);
}

TEST_CASE("McpClient::call_tool: garbled reply becomes error text", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_garbage(R"({"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"te)");
    t.push_result(2, text_content("late"));

    REQUIRE(client.call_tool("get_weather", json{{"city", "Paris"}}) ==
            "Error: No response from tool server");
}

TEST_CASE("McpClient: endless unrelated output is bounded", "[mcp]") {
    MockTransport t;
    for (int i = 0; i < 300; ++i) {
        t.push_garbage("progress " + std::to_string(i));
    }
    t.push_handshake(1);

    McpClient client(t);
    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE(err.find("unrelated lines") != std::string::npos);
}

TEST_CASE("McpClient: truncated reply from a live server does not hang", "[mcp]") {
    ProcessTransport proc(std::chrono::milliseconds(200));
    REQUIRE(proc.start({"sh", "-c",
                        "read l; echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{trunc'; "
                        "exec sleep 30"}));

    McpClient client(proc);
    std::string err;
    REQUIRE_FALSE(client.initialize(&err));
    REQUIRE(err.find("malformed reply") != std::string::npos);
    REQUIRE(proc.running());
    proc.stop();
}

TEST_CASE("McpClient: string ids are matched", "[mcp]") {
    MockTransport t;
    t.push({{"jsonrpc", "2.0"}, {"id", "1"}, {"result", json::object()}});
    McpClient client(t);
    std::string err;
    REQUIRE(client.initialize(&err));
}

TEST_CASE("McpClient: request ids strictly increase", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    REQUIRE(client.last_request_id() == 1);

    t.push_result(2, flight_tools());
    t.push_result(3, text_content("a"));
    t.push_result(4, text_content("b"));

    std::string err;
    REQUIRE(client.list_tools(&err));
    client.call_tool("get_weather", json{{"city", "Paris"}});
    client.call_tool("get_weather", json{{"city", "Oslo"}});

    REQUIRE(t.sent.size() == 3);
    REQUIRE(t.sent[0]["id"] == 2);
    REQUIRE(t.sent[1]["id"] == 3);
    REQUIRE(t.sent[2]["id"] == 4);
    REQUIRE(client.last_request_id() == 4);
}

// ── list_tools ───────────────────────────────────────────────────

TEST_CASE("McpClient::list_tools: returns definitions in server order", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_result(2, flight_tools());

    std::string err;
    auto tools = client.list_tools(&err);
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    REQUIRE((*tools)[0].name == "search_flights");
    REQUIRE((*tools)[0].arguments.size() == 4);
    REQUIRE((*tools)[1].name == "get_weather");

    REQUIRE(t.sent[0]["method"] == "tools/list");
    REQUIRE(t.sent[0]["params"].is_object());
}

TEST_CASE("McpClient::list_tools: empty list is valid", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_result(2, {{"tools", json::array()}});

    std::string err;
    auto tools = client.list_tools(&err);
    REQUIRE(tools.has_value());
    REQUIRE(tools->empty());
}

TEST_CASE("McpClient::list_tools: requires a completed handshake", "[mcp]") {
    MockTransport t;
    McpClient client(t);
    std::string err;
    REQUIRE_FALSE(client.list_tools(&err));
    REQUIRE(err == "tools/list before initialize");
    REQUIRE(t.sent.empty());
}

TEST_CASE("McpClient::list_tools: distinct failure reasons", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    std::string err;

    SECTION("error reply") {
        t.push_error(2, -32601, "Method not found");
        REQUIRE_FALSE(client.list_tools(&err));
        REQUIRE(err == "tools/list failed: Method not found");
    }
    SECTION("no result member") {
        t.push({{"jsonrpc", "2.0"}, {"id", 2}});
        REQUIRE_FALSE(client.list_tools(&err));
        REQUIRE(err.find("tools/list response has no result") == 0);
    }
    SECTION("null result") {
        t.push({{"jsonrpc", "2.0"}, {"id", 2}, {"result", nullptr}});
        REQUIRE_FALSE(client.list_tools(&err));
        REQUIRE(err == "tools/list result is null");
    }
    SECTION("result without tools array") {
        t.push_result(2, {{"tools", "none"}});
        REQUIRE_FALSE(client.list_tools(&err));
        REQUIRE(err == "tools/list result has no tools array");
    }
    SECTION("server went away") {
        REQUIRE_FALSE(client.list_tools(&err));
        REQUIRE(err.find("no response to tools/list") == 0);
    }
}

TEST_CASE("McpClient::list_tools: duplicate names are rejected", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_result(2, {{"tools", json::array({{{"name", "get_weather"}},
                                              {{"name", "get_weather"}}})}});
    std::string err;
    REQUIRE_FALSE(client.list_tools(&err));
    REQUIRE(err == "tool server declared 'get_weather' more than once");
}

TEST_CASE("McpClient::list_tools: unnamed entries are skipped", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_result(2, {{"tools", json::array({{{"description", "anonymous"}},
                                              {{"name", "get_local_news"}}})}});
    std::string err;
    auto tools = client.list_tools(&err);
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    REQUIRE((*tools)[0].name == "get_local_news");
}

// ── call_tool ────────────────────────────────────────────────────

TEST_CASE("McpClient::call_tool: flight search round trip", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_result(2, text_content("Found 3 flights from JFK to LAX on 2025-06-01"));

    json args = {{"origin", "JFK"}, {"destination", "LAX"}, {"departure_date", "2025-06-01"}};
    auto out = client.call_tool("search_flights", args);

    REQUIRE(out == "Found 3 flights from JFK to LAX on 2025-06-01");
    REQUIRE(t.sent.size() == 1);
    REQUIRE(t.sent[0]["method"] == "tools/call");
    REQUIRE(t.sent[0]["params"]["name"] == "search_flights");
    REQUIRE(t.sent[0]["params"]["arguments"] == args);
}

TEST_CASE("McpClient::call_tool: returns only the first content item", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);
    t.push_result(2, {{"content", json::array({{{"type", "text"}, {"text", "first"}},
                                               {{"type", "text"}, {"text", "second"}}})}});
    REQUIRE(client.call_tool("get_local_news", json::object()) == "first");
}

TEST_CASE("McpClient::call_tool: failures come back as text", "[mcp]") {
    MockTransport t;
    auto client = ready_client(t);

    SECTION("error reply") {
        t.push_error(2, -32000, "city not found");
        REQUIRE(client.call_tool("get_weather", json{{"city", "Atlantis"}}) ==
                "Error calling tool: city not found");
    }
    SECTION("error without message") {
        t.push({{"jsonrpc", "2.0"}, {"id", 2}, {"error", {{"code", -1}}}});
        REQUIRE(client.call_tool("get_weather", json::object()) ==
                "Error calling tool: Unknown error");
    }
    SECTION("no response") {
        REQUIRE(client.call_tool("get_weather", json::object()) ==
                "Error: No response from tool server");
    }
    SECTION("missing result") {
        t.push({{"jsonrpc", "2.0"}, {"id", 2}});
        REQUIRE(client.call_tool("get_weather", json::object()) ==
                "Error: Invalid response from tool server");
    }
    SECTION("empty content") {
        t.push_result(2, {{"content", json::array()}});
        REQUIRE(client.call_tool("get_weather", json::object()) ==
                "Error: Empty content from tool server");
    }
    SECTION("non-text content") {
        t.push_result(2, {{"content", json::array({{{"type", "image"}, {"data", "..."}}})}});
        REQUIRE(client.call_tool("get_weather", json::object()) ==
                "Error: No text content from tool server");
    }
}

TEST_CASE("McpClient::call_tool: before initialize", "[mcp]") {
    MockTransport t;
    McpClient client(t);
    REQUIRE(client.call_tool("get_weather", json::object()) ==
            "Error: Tool server is not initialized");
    REQUIRE(t.sent.empty());
}

// ── extract_rpc_error ────────────────────────────────────────────

TEST_CASE("extract_rpc_error: message, fallback and absence", "[mcp]") {
    REQUIRE(extract_rpc_error(json{{"error", {{"message", "boom"}}}}) == "boom");
    REQUIRE(extract_rpc_error(json{{"error", {{"code", 1}}}}) == "Unknown error");
    REQUIRE(extract_rpc_error(json{{"error", "plain"}}) == "plain");
    REQUIRE(extract_rpc_error(json{{"error", nullptr}}).empty());
    REQUIRE(extract_rpc_error(json{{"result", json::object()}}).empty());
}
