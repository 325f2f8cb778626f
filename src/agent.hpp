#pragma once
#include "provider.hpp"
#include "registry.hpp"
#include "config.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tether {

enum class AgentState { AwaitingUserInput, RequestingModel, ExecutingTools };

// How the most recent turn ended
enum class TurnStatus { Answered, ToolLoopExceeded, ProviderError };

// Progress notice emitted once per tool invocation
using ToolNoticeCallback = std::function<void(const ToolCall& call)>;

class Agent {
public:
    Agent(std::unique_ptr<Provider> provider,
          const ToolRegistry& registry,
          const Config& config);

    // Process a user message and return the assistant's final text reply.
    // Never throws for provider or tool failures; those come back as text.
    std::string process(const std::string& user_message);

    const std::vector<ChatMessage>& history() const { return history_; }
    size_t history_size() const { return history_.size(); }

    // Reset history to the seeded system message
    void clear_history();

    AgentState state() const { return state_; }
    TurnStatus last_status() const { return last_status_; }

    // Tokens reported by the provider since construction
    const TokenUsage& usage() const { return usage_; }

    void set_model(const std::string& model) { model_ = model; }
    const std::string& model() const { return model_; }
    std::string provider_name() const;

    // Replace the default "[tool] <name>" stderr notice
    void set_tool_notice(ToolNoticeCallback callback) { on_tool_ = std::move(callback); }

private:
    void seed_history();
    void accumulate_usage(const TokenUsage& usage);
    std::string finish_turn(TurnStatus status, std::string reply);

    std::unique_ptr<Provider> provider_;
    const ToolRegistry& registry_;
    std::vector<ToolDefinition> catalogue_;
    std::vector<ChatMessage> history_;
    std::string system_prompt_;
    std::string model_;
    double temperature_;
    uint32_t max_tool_iterations_;
    AgentState state_ = AgentState::AwaitingUserInput;
    TurnStatus last_status_ = TurnStatus::Answered;
    TokenUsage usage_;
    ToolNoticeCallback on_tool_;
};

} // namespace tether
