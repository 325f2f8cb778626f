#pragma once
#include "tool.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace tether {

class McpClient;

// Raised when two tools claim the same name
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// In-process tool
class LocalTool {
public:
    explicit LocalTool(std::shared_ptr<Tool> tool);

    const ToolDefinition& definition() const { return definition_; }
    std::string invoke(const nlohmann::json& arguments) const;

private:
    std::shared_ptr<Tool> tool_;
    ToolDefinition definition_;
};

// Tool exposed by the tool server; validated locally, executed remotely
class RemoteTool {
public:
    RemoteTool(ToolDefinition definition, McpClient& client);

    const ToolDefinition& definition() const { return definition_; }
    std::string invoke(const nlohmann::json& arguments) const;

private:
    ToolDefinition definition_;
    McpClient* client_;
};

using ToolEntry = std::variant<LocalTool, RemoteTool>;

// "Error: Missing required arguments: a, b", or empty if none missing
std::string missing_arguments_error(const ToolDefinition& definition,
                                    const nlohmann::json& arguments);

// Unified name -> tool map built once at startup.
class ToolRegistry {
public:
    ToolRegistry() = default;

    // Throws RegistryError on any duplicate name. `client` may be null only
    // when `remote` is empty.
    static ToolRegistry build(std::vector<std::unique_ptr<Tool>> local,
                              const std::vector<ToolDefinition>& remote,
                              McpClient* client);

    // Result text of the named tool, or "Error: Unknown tool: <name>".
    // Tool-level errors are returned as text like any other result.
    std::string dispatch(const std::string& name, const nlohmann::json& arguments) const;

    bool is_remote(const std::string& name) const;

    // Catalogue in registration order: local tools, then remote tools
    std::vector<ToolDefinition> definitions() const;

    size_t size() const { return order_.size(); }
    size_t local_count() const;
    size_t remote_count() const;

private:
    void add(const std::string& name, ToolEntry entry);

    std::unordered_map<std::string, ToolEntry> tools_;
    std::vector<std::string> order_;
};

} // namespace tether
