#pragma once
#include "tool.hpp"
#include "transport.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tether {

struct ClientIdentity {
    std::string protocol_version = "2024-11-05";
    std::string name = "tether";
    std::string version = "1.0.0";
};

// JSON-RPC client for a tool server: handshake, discovery, invocation.
// Strictly synchronous: one request in flight, replies matched by id.
class McpClient {
public:
    explicit McpClient(Transport& transport, ClientIdentity identity = ClientIdentity{});

    // initialize request + notifications/initialized. False on a missing
    // response or an error reply; *err gets the server's message if any.
    bool initialize(std::string* err);

    // tools/list. nullopt on failure, with a distinct reason in *err.
    std::optional<std::vector<ToolDefinition>> list_tools(std::string* err);

    // tools/call. Never throws: every failure comes back as error text.
    std::string call_tool(const std::string& name, const nlohmann::json& arguments);

    bool initialized() const { return initialized_; }

    // Id of the most recent request (0 before the first one)
    int64_t last_request_id() const { return next_id_ - 1; }

private:
    std::optional<nlohmann::json> request(const std::string& method,
                                          const nlohmann::json& params,
                                          std::string* err);
    bool notify(const std::string& method, const nlohmann::json& params);
    std::optional<nlohmann::json> await_response(int64_t id, std::string* err);

    Transport& transport_;
    ClientIdentity identity_;
    int64_t next_id_ = 1;
    bool initialized_ = false;
};

// Message of a JSON-RPC error member; empty if the response has none
std::string extract_rpc_error(const nlohmann::json& response);

} // namespace tether
