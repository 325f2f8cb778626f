#include <catch2/catch_test_macros.hpp>
#include "mock_transport.hpp"
#include "registry.hpp"
#include "mcp_client.hpp"
#include <stdexcept>

using namespace tether;
using json = nlohmann::json;

// ── Mock tools ───────────────────────────────────────────────────

class EchoTool : public Tool {
public:
    explicit EchoTool(std::string name, int* calls = nullptr)
        : name_(std::move(name)), calls_(calls) {}

    std::string execute(const json& args) override {
        if (calls_) (*calls_)++;
        return "echo:" + args.value("text", std::string());
    }
    ToolDefinition definition() const override {
        return ToolDefinition{name_, "Echo text", {ArgumentSpec{"text", true, "", ""}}};
    }

private:
    std::string name_;
    int* calls_;
};

class ThrowingTool : public Tool {
public:
    std::string execute(const json&) override {
        throw std::runtime_error("disk on fire");
    }
    ToolDefinition definition() const override {
        return ToolDefinition{"explode", "", {}};
    }
};

static std::vector<std::unique_ptr<Tool>> tools_of(std::unique_ptr<Tool> a,
                                                   std::unique_ptr<Tool> b = nullptr) {
    std::vector<std::unique_ptr<Tool>> v;
    v.push_back(std::move(a));
    if (b) v.push_back(std::move(b));
    return v;
}

static ToolDefinition remote_def(const std::string& name,
                                 std::vector<ArgumentSpec> args = {}) {
    return ToolDefinition{name, "remote " + name, std::move(args)};
}

// ── Build ────────────────────────────────────────────────────────

TEST_CASE("ToolRegistry: local then remote in registration order", "[registry]") {
    MockTransport t;
    McpClient client(t);
    auto reg = ToolRegistry::build(tools_of(std::make_unique<EchoTool>("echo")),
                                   {remote_def("get_weather"), remote_def("get_local_news")},
                                   &client);

    REQUIRE(reg.size() == 3);
    REQUIRE(reg.local_count() == 1);
    REQUIRE(reg.remote_count() == 2);
    REQUIRE(reg.is_remote("get_weather"));
    REQUIRE_FALSE(reg.is_remote("echo"));
    REQUIRE_FALSE(reg.is_remote("nope"));

    auto defs = reg.definitions();
    REQUIRE(defs.size() == 3);
    REQUIRE(defs[0].name == "echo");
    REQUIRE(defs[1].name == "get_weather");
    REQUIRE(defs[2].name == "get_local_news");
}

TEST_CASE("ToolRegistry: local/remote name collision fails startup", "[registry]") {
    MockTransport t;
    McpClient client(t);
    REQUIRE_THROWS_AS(ToolRegistry::build(tools_of(std::make_unique<EchoTool>("tool_calc")),
                                          {remote_def("tool_calc")}, &client),
                      RegistryError);
}

TEST_CASE("ToolRegistry: collision message names the tool", "[registry]") {
    MockTransport t;
    McpClient client(t);
    try {
        ToolRegistry::build(tools_of(std::make_unique<EchoTool>("tool_time")),
                            {remote_def("tool_time")}, &client);
        FAIL("expected RegistryError");
    } catch (const RegistryError& e) {
        REQUIRE(std::string(e.what()) ==
                "tool name collision: 'tool_time' is defined as both local and remote tool");
    }
}

TEST_CASE("ToolRegistry: duplicate local tools are rejected", "[registry]") {
    REQUIRE_THROWS_AS(ToolRegistry::build(tools_of(std::make_unique<EchoTool>("echo"),
                                                   std::make_unique<EchoTool>("echo")),
                                          {}, nullptr),
                      RegistryError);
}

TEST_CASE("ToolRegistry: remote tools need a client", "[registry]") {
    REQUIRE_THROWS_AS(ToolRegistry::build({}, {remote_def("get_weather")}, nullptr),
                      RegistryError);
}

// ── Dispatch ─────────────────────────────────────────────────────

TEST_CASE("ToolRegistry::dispatch: local tool runs in process", "[registry]") {
    int calls = 0;
    auto reg = ToolRegistry::build(tools_of(std::make_unique<EchoTool>("echo", &calls)),
                                   {}, nullptr);
    REQUIRE(reg.dispatch("echo", json{{"text", "hi"}}) == "echo:hi");
    REQUIRE(calls == 1);
}

TEST_CASE("ToolRegistry::dispatch: unknown tool", "[registry]") {
    auto reg = ToolRegistry::build(tools_of(std::make_unique<EchoTool>("echo")), {}, nullptr);
    REQUIRE(reg.dispatch("teleport", json::object()) == "Error: Unknown tool: teleport");
}

TEST_CASE("ToolRegistry::dispatch: missing required arguments skip execution", "[registry]") {
    int calls = 0;
    auto reg = ToolRegistry::build(tools_of(std::make_unique<EchoTool>("echo", &calls)),
                                   {}, nullptr);
    REQUIRE(reg.dispatch("echo", json::object()) == "Error: Missing required arguments: text");
    REQUIRE(reg.dispatch("echo", json{{"text", nullptr}}) ==
            "Error: Missing required arguments: text");
    REQUIRE(calls == 0);
}

TEST_CASE("ToolRegistry::dispatch: null arguments mean empty object", "[registry]") {
    auto reg = ToolRegistry::build(tools_of(std::make_unique<ThrowingTool>()), {}, nullptr);
    REQUIRE(reg.dispatch("explode", json()) == "Error: disk on fire");
}

TEST_CASE("ToolRegistry::dispatch: non-object arguments are rejected", "[registry]") {
    auto reg = ToolRegistry::build(tools_of(std::make_unique<EchoTool>("echo")), {}, nullptr);
    REQUIRE(reg.dispatch("echo", json::array({1, 2})) ==
            "Error: Arguments for echo must be a JSON object");
}

TEST_CASE("ToolRegistry::dispatch: local exceptions become error text", "[registry]") {
    auto reg = ToolRegistry::build(tools_of(std::make_unique<ThrowingTool>()), {}, nullptr);
    REQUIRE(reg.dispatch("explode", json::object()) == "Error: disk on fire");
}

TEST_CASE("ToolRegistry::dispatch: remote tool goes over the wire", "[registry]") {
    MockTransport t;
    t.push_handshake(1);
    McpClient client(t);
    std::string err;
    REQUIRE(client.initialize(&err));
    t.sent.clear();

    auto reg = ToolRegistry::build({}, {remote_def("get_weather", {ArgumentSpec{"city", true, "", ""}})},
                                   &client);
    t.push_result(2, {{"content", json::array({{{"type", "text"}, {"text", "Sunny, 22C"}}})}});

    REQUIRE(reg.dispatch("get_weather", json{{"city", "Paris"}}) == "Sunny, 22C");
    REQUIRE(t.sent.size() == 1);
    REQUIRE(t.sent[0]["params"]["name"] == "get_weather");
    REQUIRE(t.sent[0]["params"]["arguments"]["city"] == "Paris");
}

TEST_CASE("ToolRegistry::dispatch: remote validation happens before any request", "[registry]") {
    MockTransport t;
    McpClient client(t);
    auto reg = ToolRegistry::build(
        {},
        {remote_def("search_flights", {ArgumentSpec{"origin", true, "", ""},
                                       ArgumentSpec{"destination", true, "", ""},
                                       ArgumentSpec{"departure_date", true, "", ""},
                                       ArgumentSpec{"return_date", false, "", ""}})},
        &client);

    REQUIRE(reg.dispatch("search_flights", json{{"origin", "JFK"}}) ==
            "Error: Missing required arguments: destination, departure_date");
    REQUIRE(t.sent.empty());
}

TEST_CASE("missing_arguments_error: empty when satisfied", "[registry]") {
    ToolDefinition def{"t", "", {ArgumentSpec{"a", true, "", ""}}};
    REQUIRE(missing_arguments_error(def, json{{"a", 1}}).empty());
    REQUIRE(missing_arguments_error(def, json::object()) == "Error: Missing required arguments: a");
}
