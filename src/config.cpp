#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace tether {

static constexpr uint64_t kMaxToolIterations = 1000;
static constexpr uint64_t kMaxStopGraceSeconds = 3600;

// Read an integer in [min, max] into `out`; anything else keeps the default
static void read_bounded(const nlohmann::json& obj, const char* key, const char* path,
                         uint64_t min, uint64_t max, uint32_t& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (v.is_number_unsigned()) {
        uint64_t n = v.get<uint64_t>();
        if (n >= min && n <= max) {
            out = static_cast<uint32_t>(n);
            return;
        }
    }
    std::cerr << "[config] " << path << " must be an integer in [" << min << ", "
              << max << "], got " << v.dump() << "; using " << out << "\n";
}

Config::Config() : system_prompt(default_system_prompt()) {}

std::string Config::default_system_prompt() {
    return "You are a helpful AI assistant with access to tools.\n"
           "\n"
           "You can:\n"
           "- Get the current time when needed\n"
           "- Perform mathematical calculations\n"
           "- Use any additional tools provided by the connected tool server, "
           "such as weather, local news or airline ticket searches\n"
           "\n"
           "Always be concise and helpful. Use tools when appropriate to provide "
           "accurate information.";
}

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "anthropic"},
        {"model", "claude-sonnet-4-5-20250929"},
        {"temperature", 0.7},
        {"system_prompt", default_system_prompt()},
        {"providers", {
            {"anthropic", {{"api_key", ""}, {"base_url", ""}}}
        }},
        {"agent", {
            {"max_tool_iterations", 10}
        }},
        {"server", {
            {"command", nlohmann::json::array()},
            {"stop_grace_seconds", 5},
            {"protocol_version", "2024-11-05"},
            {"client_name", "tether"},
            {"client_version", "1.0.0"}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config config_from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("system_prompt") && j["system_prompt"].is_string())
        cfg.system_prompt = j["system_prompt"].get<std::string>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        read_bounded(a, "max_tool_iterations", "agent.max_tool_iterations",
                     1, kMaxToolIterations, cfg.agent.max_tool_iterations);
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("command")) {
            // Accept either an argv array or a single command string
            if (s["command"].is_array()) {
                for (const auto& word : s["command"]) {
                    if (word.is_string()) cfg.server.command.push_back(word.get<std::string>());
                }
            } else if (s["command"].is_string()) {
                cfg.server.command = split_command(s["command"].get<std::string>());
            }
        }
        read_bounded(s, "stop_grace_seconds", "server.stop_grace_seconds",
                     0, kMaxStopGraceSeconds, cfg.server.stop_grace_seconds);
        if (s.contains("protocol_version") && s["protocol_version"].is_string())
            cfg.server.protocol_version = s["protocol_version"].get<std::string>();
        if (s.contains("client_name") && s["client_name"].is_string())
            cfg.server.client_name = s["client_name"].get<std::string>();
        if (s.contains("client_version") && s["client_version"].is_string())
            cfg.server.client_version = s["client_version"].get<std::string>();
    }

    return cfg;
}

void apply_env_overrides(Config& cfg) {
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        cfg.providers["anthropic"].api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_BASE_URL"))
        cfg.providers["anthropic"].base_url = v;
    if (const char* v = std::getenv("TETHER_SERVER_COMMAND"))
        cfg.server.command = split_command(v);
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = config_from_json(j);
    // Environment variables always override config file
    apply_env_overrides(cfg);
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.tether/config.json"));
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace tether
