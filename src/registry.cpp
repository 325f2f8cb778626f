#include "registry.hpp"
#include "mcp_client.hpp"
#include "util.hpp"
#include <utility>

namespace tether {

std::string missing_arguments_error(const ToolDefinition& definition,
                                    const nlohmann::json& arguments) {
    auto missing = definition.missing_required(arguments);
    if (missing.empty()) return {};
    return "Error: Missing required arguments: " + join(missing, ", ");
}

LocalTool::LocalTool(std::shared_ptr<Tool> tool)
    : tool_(std::move(tool)), definition_(tool_->definition()) {}

std::string LocalTool::invoke(const nlohmann::json& arguments) const {
    auto err = missing_arguments_error(definition_, arguments);
    if (!err.empty()) return err;
    try {
        return tool_->execute(arguments);
    } catch (const std::exception& e) {
        return std::string("Error: ") + e.what();
    }
}

RemoteTool::RemoteTool(ToolDefinition definition, McpClient& client)
    : definition_(std::move(definition)), client_(&client) {}

std::string RemoteTool::invoke(const nlohmann::json& arguments) const {
    auto err = missing_arguments_error(definition_, arguments);
    if (!err.empty()) return err;
    return client_->call_tool(definition_.name, arguments);
}

ToolRegistry ToolRegistry::build(std::vector<std::unique_ptr<Tool>> local,
                                 const std::vector<ToolDefinition>& remote,
                                 McpClient* client) {
    if (!remote.empty() && client == nullptr) {
        throw RegistryError("remote tools declared without a tool server client");
    }

    ToolRegistry registry;
    for (auto& tool : local) {
        LocalTool entry(std::shared_ptr<Tool>(std::move(tool)));
        std::string name = entry.definition().name;
        registry.add(name, std::move(entry));
    }
    for (const auto& def : remote) {
        registry.add(def.name, RemoteTool(def, *client));
    }
    return registry;
}

void ToolRegistry::add(const std::string& name, ToolEntry entry) {
    if (name.empty()) {
        throw RegistryError("tool with an empty name");
    }
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        bool existing_remote = std::holds_alternative<RemoteTool>(it->second);
        bool new_remote = std::holds_alternative<RemoteTool>(entry);
        auto kind = [](bool remote) { return remote ? "remote" : "local"; };
        throw RegistryError("tool name collision: '" + name + "' is defined as both " +
                            kind(existing_remote) + " and " + kind(new_remote) + " tool");
    }
    tools_.emplace(name, std::move(entry));
    order_.push_back(name);
}

std::string ToolRegistry::dispatch(const std::string& name,
                                   const nlohmann::json& arguments) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return "Error: Unknown tool: " + name;
    }

    nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        return "Error: Arguments for " + name + " must be a JSON object";
    }

    return std::visit([&args](const auto& tool) { return tool.invoke(args); }, it->second);
}

bool ToolRegistry::is_remote(const std::string& name) const {
    auto it = tools_.find(name);
    return it != tools_.end() && std::holds_alternative<RemoteTool>(it->second);
}

std::vector<ToolDefinition> ToolRegistry::definitions() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(order_.size());
    for (const auto& name : order_) {
        const auto& entry = tools_.at(name);
        defs.push_back(std::visit([](const auto& tool) { return tool.definition(); }, entry));
    }
    return defs;
}

size_t ToolRegistry::local_count() const {
    size_t n = 0;
    for (const auto& [name, entry] : tools_) {
        if (std::holds_alternative<LocalTool>(entry)) n++;
    }
    return n;
}

size_t ToolRegistry::remote_count() const {
    return tools_.size() - local_count();
}

} // namespace tether
