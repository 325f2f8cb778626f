#include "session.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace tether {

Session::Session(const Config& config,
                 std::unique_ptr<Provider> provider,
                 std::vector<std::unique_ptr<Tool>> local_tools) {
    std::vector<ToolDefinition> remote;
    if (config.server.enabled()) {
        remote = connect_tool_server(config.server);
    }

    registry_ = ToolRegistry::build(std::move(local_tools), remote, client_.get());
    agent_ = std::make_unique<Agent>(std::move(provider), registry_, config);
}

Session::~Session() {
    shutdown();
}

void Session::shutdown() {
    if (transport_ && transport_->running()) {
        transport_->stop();
        std::cerr << "[mcp] Tool server stopped\n";
    }
}

void Session::fail_startup(const std::string& what) {
    if (transport_) {
        std::string diagnostics = trim(transport_->drain_stderr());
        if (!diagnostics.empty()) {
            std::cerr << "[mcp] Server stderr:\n" << diagnostics << "\n";
        }
        transport_->stop();
    }
    throw std::runtime_error(what);
}

std::vector<ToolDefinition> Session::connect_tool_server(const ServerConfig& server) {
    std::cerr << "[mcp] Starting tool server: " << join(server.command, " ") << "\n";

    transport_ = std::make_unique<ProcessTransport>(
        std::chrono::seconds(server.stop_grace_seconds));

    std::string err;
    if (!transport_->start(server.command, &err)) {
        fail_startup("Failed to start tool server: " + err);
    }

    ClientIdentity identity;
    identity.protocol_version = server.protocol_version;
    identity.name = server.client_name;
    identity.version = server.client_version;
    client_ = std::make_unique<McpClient>(*transport_, identity);

    if (!client_->initialize(&err)) {
        fail_startup("Tool server handshake failed: " + err);
    }

    auto tools = client_->list_tools(&err);
    if (!tools) {
        fail_startup("Tool discovery failed: " + err);
    }

    std::cerr << "[mcp] Tool server started with " << tools->size() << " tools\n";
    for (const auto& tool : *tools) {
        std::cerr << "[mcp]    - " << tool.name << "\n";
    }
    return *tools;
}

} // namespace tether
