#pragma once
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace tether {

// One declared parameter of a tool. Types are opaque; `type` is only
// echoed back to the model when the server declared one.
struct ArgumentSpec {
    std::string name;
    bool required = false;
    std::string description;
    std::string type;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ArgumentSpec> arguments;

    // JSON schema object advertised to the model
    nlohmann::json input_schema() const;

    // Names of required arguments absent from `args`, in declaration order
    std::vector<std::string> missing_required(const nlohmann::json& args) const;
};

// Build a ToolDefinition from a tools/list entry
// ({name, description, inputSchema:{properties, required}}).
// Returns a definition with an empty name if the entry has none.
ToolDefinition parse_tool_definition(const nlohmann::json& entry);

// In-process tool implementation. Errors are reported as text.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string execute(const nlohmann::json& args) = 0;
    virtual ToolDefinition definition() const = 0;

    std::string tool_name() const { return definition().name; }
};

// Create all built-in local tools
std::vector<std::unique_ptr<Tool>> create_builtin_tools();

} // namespace tether
