#pragma once
#include "agent.hpp"
#include "config.hpp"
#include "mcp_client.hpp"
#include "registry.hpp"
#include "tool.hpp"
#include "transport.hpp"
#include <memory>
#include <vector>

namespace tether {

// Everything one program run needs, built once at startup:
// tool server process, protocol client, unified registry, agent.
//
// Construction throws std::runtime_error if the tool server cannot be
// spawned, fails the handshake or fails discovery, and RegistryError on a
// tool name collision. The server process is stopped on destruction.
class Session {
public:
    Session(const Config& config,
            std::unique_ptr<Provider> provider,
            std::vector<std::unique_ptr<Tool>> local_tools);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Agent& agent() { return *agent_; }
    const ToolRegistry& registry() const { return registry_; }

    bool has_tool_server() const { return transport_ != nullptr; }

    // Stop the tool server now. Safe to call repeatedly.
    void shutdown();

private:
    std::vector<ToolDefinition> connect_tool_server(const ServerConfig& server);
    [[noreturn]] void fail_startup(const std::string& what);

    std::unique_ptr<ProcessTransport> transport_;
    std::unique_ptr<McpClient> client_;
    ToolRegistry registry_;
    std::unique_ptr<Agent> agent_;
};

} // namespace tether
