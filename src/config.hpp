#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tether {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct AgentConfig {
    uint32_t max_tool_iterations = 10;
};

// External tool server launched as a child process
struct ServerConfig {
    std::vector<std::string> command; // empty = no tool server
    uint32_t stop_grace_seconds = 5;
    std::string protocol_version = "2024-11-05";
    std::string client_name = "tether";
    std::string client_version = "1.0.0";

    bool enabled() const { return !command.empty(); }
};

struct Config {
    std::string provider = "anthropic";
    std::string model = "claude-sonnet-4-5-20250929";
    double temperature = 0.7;
    std::string system_prompt;

    std::unordered_map<std::string, ProviderEntry> providers;

    AgentConfig agent;
    ServerConfig server;

    Config();

    // Load from ~/.tether/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if missing)
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Built-in system prompt seeded into every conversation
    static std::string default_system_prompt();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;
};

// Populate a Config from a parsed JSON document. Unknown keys are ignored,
// keys with the wrong type keep their defaults.
Config config_from_json(const nlohmann::json& j);

// Recursively fill keys missing from `existing` with values from `defaults`
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

// Apply ANTHROPIC_API_KEY, ANTHROPIC_BASE_URL and TETHER_SERVER_COMMAND
void apply_env_overrides(Config& cfg);

} // namespace tether
