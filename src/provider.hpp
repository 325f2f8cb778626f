#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace tether {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

// A model-issued request to run one tool
struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ChatMessage {
    Role role;
    std::string content;
    std::vector<ToolCall> tool_calls;         // assistant only
    std::optional<std::string> tool_call_id;  // tool only
    std::optional<std::string> name;          // tool only: which tool answered
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    std::vector<ToolCall> tool_calls;
    TokenUsage usage;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Language-model collaborator: full history + tool catalogue in, one
// assistant message (text and/or tool calls) out. Throws on failure.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::vector<ToolDefinition>& tools,
                              const std::string& model,
                              double temperature) = 0;

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration

// Factory: create provider by name. Throws std::invalid_argument for
// unknown names.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url = "");

} // namespace tether
