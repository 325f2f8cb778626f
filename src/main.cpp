#include "config.hpp"
#include "provider.hpp"
#include "tool.hpp"
#include "agent.hpp"
#include "http.hpp"
#include "session.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: tether [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --provider NAME      Use specific provider (anthropic)\n"
              << "  --model NAME         Use specific model\n"
              << "  --server CMD         Tool server command line (overrides config)\n"
              << "  --no-server          Run with local tools only\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /tools               List available tools\n"
              << "  /status              Show provider, model and history info\n"
              << "  /clear               Clear conversation history\n"
              << "  /help                Show available commands\n"
              << "  quit, /quit, /exit   Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY      API key for Anthropic\n"
              << "  ANTHROPIC_BASE_URL     Override the Anthropic API base URL\n"
              << "  TETHER_SERVER_COMMAND  Tool server command line\n";
}

static void print_tools(const tether::ToolRegistry& registry) {
    for (const auto& def : registry.definitions()) {
        std::cout << "  " << def.name
                  << (registry.is_remote(def.name) ? " (remote)" : " (local)");
        if (!def.arguments.empty()) {
            std::cout << " [";
            for (size_t i = 0; i < def.arguments.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << def.arguments[i].name
                          << (def.arguments[i].required ? "" : "?");
            }
            std::cout << "]";
        }
        std::cout << "\n";
    }
}

static bool is_quit(const std::string& line) {
    return line == "quit" || line == "/quit" || line == "/exit";
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string provider_name;
    std::string model_name;
    std::string server_command;
    bool no_server = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server_command = argv[++i];
        } else if (std::strcmp(argv[i], "--no-server") == 0) {
            no_server = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    tether::http_init();
    auto config = tether::Config::load();

    // Override config with CLI args
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;
    if (!server_command.empty()) config.server.command = tether::split_command(server_command);
    if (no_server) config.server.command.clear();

    tether::CurlHttpClient http_client;
    std::unique_ptr<tether::Provider> provider;
    try {
        provider = tether::create_provider(config.provider,
                                           config.api_key_for(config.provider),
                                           http_client,
                                           config.base_url_for(config.provider));
    } catch (const std::exception& e) {
        std::cerr << "Error creating provider: " << e.what() << "\n";
        tether::http_cleanup();
        return 1;
    }

    // Tool server startup failures are fatal
    std::unique_ptr<tether::Session> session;
    try {
        session = std::make_unique<tether::Session>(config, std::move(provider),
                                                    tether::create_builtin_tools());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        tether::http_cleanup();
        return 1;
    }

    auto& agent = session->agent();
    agent.set_tool_notice([](const tether::ToolCall& call) {
        std::cout << "\n[Using tool: " << call.name << "]" << std::endl;
    });

    // Single message mode
    if (!message.empty()) {
        std::cout << agent.process(message) << '\n';
        session.reset();
        tether::http_cleanup();
        return 0;
    }

    std::cout << "Chat with AI Agent (type 'quit' to exit)\n"
              << "Provider: " << agent.provider_name()
              << " | Model: " << agent.model()
              << " | Tools: " << session->registry().size() << "\n"
              << "Type /help for commands.\n\n";

    std::string line;
    while (true) {
        std::cout << "You: " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = tether::trim(line);
        if (line.empty()) continue;
        if (is_quit(line)) break;

        if (line[0] == '/') {
            if (line == "/status") {
                std::cout << "Provider: " << agent.provider_name() << "\n"
                          << "Model: " << agent.model() << "\n"
                          << "History: " << agent.history_size() << " messages\n"
                          << "Tokens: " << agent.usage().prompt_tokens << " in, "
                          << agent.usage().completion_tokens << " out\n"
                          << "Tools: " << session->registry().local_count() << " local, "
                          << session->registry().remote_count() << " remote\n";
            } else if (line == "/tools") {
                print_tools(session->registry());
            } else if (line == "/clear") {
                agent.clear_history();
                std::cout << "History cleared.\n";
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /tools    List available tools\n"
                          << "  /status   Show current status\n"
                          << "  /clear    Clear conversation history\n"
                          << "  /quit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        std::string response = agent.process(line);
        std::cout << "\nAI-Agent: " << response << "\n\n";
    }

    session.reset();
    tether::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
