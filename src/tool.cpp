#include "tool.hpp"
#include "tools/calc.hpp"
#include "tools/time.hpp"

namespace tether {

nlohmann::json ToolDefinition::input_schema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& arg : arguments) {
        nlohmann::json prop;
        prop["type"] = arg.type.empty() ? "string" : arg.type;
        if (!arg.description.empty()) {
            prop["description"] = arg.description;
        }
        properties[arg.name] = prop;
        if (arg.required) {
            required.push_back(arg.name);
        }
    }
    return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

std::vector<std::string> ToolDefinition::missing_required(const nlohmann::json& args) const {
    std::vector<std::string> missing;
    for (const auto& arg : arguments) {
        if (!arg.required) continue;
        if (!args.is_object() || !args.contains(arg.name) || args[arg.name].is_null()) {
            missing.push_back(arg.name);
        }
    }
    return missing;
}

ToolDefinition parse_tool_definition(const nlohmann::json& entry) {
    ToolDefinition def;
    if (!entry.is_object()) return def;

    if (entry.contains("name") && entry["name"].is_string())
        def.name = entry["name"].get<std::string>();
    if (entry.contains("description") && entry["description"].is_string())
        def.description = entry["description"].get<std::string>();

    if (!entry.contains("inputSchema") || !entry["inputSchema"].is_object()) {
        return def;
    }
    const auto& schema = entry["inputSchema"];

    std::vector<std::string> required;
    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& r : schema["required"]) {
            if (r.is_string()) required.push_back(r.get<std::string>());
        }
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        for (auto& [name, prop] : schema["properties"].items()) {
            ArgumentSpec spec;
            spec.name = name;
            for (const auto& r : required) {
                if (r == name) {
                    spec.required = true;
                    break;
                }
            }
            if (prop.is_object()) {
                if (prop.contains("description") && prop["description"].is_string())
                    spec.description = prop["description"].get<std::string>();
                if (prop.contains("type") && prop["type"].is_string())
                    spec.type = prop["type"].get<std::string>();
            }
            def.arguments.push_back(std::move(spec));
        }
    }

    // A required name without a property entry is still required
    for (const auto& r : required) {
        bool known = false;
        for (const auto& spec : def.arguments) {
            if (spec.name == r) {
                known = true;
                break;
            }
        }
        if (!known) {
            def.arguments.push_back(ArgumentSpec{r, true, "", ""});
        }
    }

    return def;
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools() {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<TimeTool>());
    tools.push_back(std::make_unique<CalcTool>());
    return tools;
}

} // namespace tether
