#include "provider.hpp"
#include "providers/anthropic.hpp"
#include <stdexcept>

namespace tether {

std::unique_ptr<Provider> create_provider(const std::string& name,
                                           const std::string& api_key,
                                           HttpClient& http,
                                           const std::string& base_url) {
    if (name == "anthropic") {
        if (api_key.empty()) {
            throw std::invalid_argument("No API key for anthropic (set ANTHROPIC_API_KEY)");
        }
        return std::make_unique<AnthropicProvider>(api_key, http, base_url);
    }
    throw std::invalid_argument("Unknown provider: " + name);
}

} // namespace tether
