#include "agent.hpp"
#include <iostream>

namespace tether {

Agent::Agent(std::unique_ptr<Provider> provider,
             const ToolRegistry& registry,
             const Config& config)
    : provider_(std::move(provider))
    , registry_(registry)
    , catalogue_(registry.definitions())
    , system_prompt_(config.system_prompt)
    , model_(config.model)
    , temperature_(config.temperature)
    , max_tool_iterations_(config.agent.max_tool_iterations)
{
    seed_history();
}

void Agent::seed_history() {
    history_.push_back(ChatMessage{Role::System, system_prompt_, {}, {}, {}});
}

void Agent::clear_history() {
    history_.clear();
    seed_history();
    state_ = AgentState::AwaitingUserInput;
}

std::string Agent::provider_name() const {
    return provider_->provider_name();
}

void Agent::accumulate_usage(const TokenUsage& usage) {
    usage_.prompt_tokens += usage.prompt_tokens;
    usage_.completion_tokens += usage.completion_tokens;
    usage_.total_tokens += usage.total_tokens;
}

std::string Agent::finish_turn(TurnStatus status, std::string reply) {
    last_status_ = status;
    state_ = AgentState::AwaitingUserInput;
    return reply;
}

std::string Agent::process(const std::string& user_message) {
    history_.push_back(ChatMessage{Role::User, user_message, {}, {}, {}});
    state_ = AgentState::RequestingModel;

    uint32_t iterations = 0;
    while (true) {
        if (iterations >= max_tool_iterations_) {
            std::string notice = "[Tool loop exceeded after " +
                                 std::to_string(iterations) + " iterations]";
            std::cerr << "[agent] " << notice << "\n";
            // Keep user/assistant alternation intact for the next turn
            history_.push_back(ChatMessage{Role::Assistant, notice, {}, {}, {}});
            return finish_turn(TurnStatus::ToolLoopExceeded, notice);
        }
        iterations++;

        ChatResponse response;
        try {
            response = provider_->chat(history_, catalogue_, model_, temperature_);
        } catch (const std::exception& e) {
            return finish_turn(TurnStatus::ProviderError,
                               std::string("Error calling provider: ") + e.what());
        }

        accumulate_usage(response.usage);

        if (!response.has_tool_calls()) {
            // An empty assistant message would be rejected on every later request
            std::string reply = response.content.value_or("");
            if (reply.empty()) reply = "[No response]";
            history_.push_back(ChatMessage{Role::Assistant, reply, {}, {}, {}});
            return finish_turn(TurnStatus::Answered, reply);
        }

        history_.push_back(ChatMessage{Role::Assistant, response.content.value_or(""),
                                       response.tool_calls, {}, {}});

        // Every call is answered, in request order, before the next model call
        state_ = AgentState::ExecutingTools;
        for (const auto& call : response.tool_calls) {
            if (on_tool_) {
                on_tool_(call);
            } else {
                std::cerr << "[tool] " << call.name << '\n';
            }

            std::string output = registry_.dispatch(call.name, call.arguments);
            history_.push_back(ChatMessage{Role::Tool, output, {}, call.id, call.name});
        }
        state_ = AgentState::RequestingModel;
    }
}

} // namespace tether
