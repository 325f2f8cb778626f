#include "mcp_client.hpp"
#include <iostream>
#include <unordered_set>
#include <utility>

namespace tether {

namespace {

// Consecutive non-protocol lines tolerated while waiting for one reply
constexpr int kMaxSkippedLines = 256;

std::string truncate_for_log(const std::string& s, size_t max_chars = 200) {
    if (s.size() <= max_chars) return s;
    return s.substr(0, max_chars) + "...(truncated)";
}

bool id_matches(const nlohmann::json& id, int64_t expected) {
    if (id.is_number_integer()) return id.get<int64_t>() == expected;
    if (id.is_string()) return id.get<std::string>() == std::to_string(expected);
    return false;
}

} // namespace

std::string extract_rpc_error(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("error")) return {};
    const auto& e = response["error"];
    if (e.is_null()) return {};
    std::string msg;
    if (e.is_object() && e.contains("message") && e["message"].is_string()) {
        msg = e["message"].get<std::string>();
    } else if (e.is_string()) {
        msg = e.get<std::string>();
    }
    if (msg.empty()) msg = "Unknown error";
    return msg;
}

McpClient::McpClient(Transport& transport, ClientIdentity identity)
    : transport_(transport), identity_(std::move(identity)) {}

bool McpClient::initialize(std::string* err) {
    nlohmann::json params;
    params["protocolVersion"] = identity_.protocol_version;
    params["capabilities"] = nlohmann::json::object();
    params["clientInfo"] = {{"name", identity_.name}, {"version", identity_.version}};

    auto resp = request("initialize", params, err);
    if (!resp) {
        if (err) *err = "no response to initialize: " + *err;
        return false;
    }

    auto rpc_err = extract_rpc_error(*resp);
    if (!rpc_err.empty()) {
        if (err) *err = "initialize failed: " + rpc_err;
        return false;
    }
    if (!resp->contains("result") || (*resp)["result"].is_null()) {
        if (err) *err = "initialize response has no result";
        return false;
    }

    if (!notify("notifications/initialized", nlohmann::json::object())) {
        std::cerr << "[mcp] Failed to send initialized notification\n";
    }
    initialized_ = true;
    return true;
}

std::optional<std::vector<ToolDefinition>> McpClient::list_tools(std::string* err) {
    if (!initialized_) {
        if (err) *err = "tools/list before initialize";
        return std::nullopt;
    }

    auto resp = request("tools/list", nlohmann::json::object(), err);
    if (!resp) {
        if (err) *err = "no response to tools/list: " + *err;
        return std::nullopt;
    }

    auto rpc_err = extract_rpc_error(*resp);
    if (!rpc_err.empty()) {
        if (err) *err = "tools/list failed: " + rpc_err;
        return std::nullopt;
    }
    if (!resp->contains("result")) {
        if (err) *err = "tools/list response has no result: " + truncate_for_log(resp->dump());
        return std::nullopt;
    }
    const auto& result = (*resp)["result"];
    if (result.is_null()) {
        if (err) *err = "tools/list result is null";
        return std::nullopt;
    }
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        if (err) *err = "tools/list result has no tools array";
        return std::nullopt;
    }

    std::vector<ToolDefinition> tools;
    std::unordered_set<std::string> seen;
    for (const auto& entry : result["tools"]) {
        ToolDefinition def = parse_tool_definition(entry);
        if (def.name.empty()) {
            std::cerr << "[mcp] Skipping unnamed tool entry\n";
            continue;
        }
        if (!seen.insert(def.name).second) {
            if (err) *err = "tool server declared '" + def.name + "' more than once";
            return std::nullopt;
        }
        tools.push_back(std::move(def));
    }
    return tools;
}

std::string McpClient::call_tool(const std::string& name, const nlohmann::json& arguments) {
    if (!initialized_) {
        return "Error: Tool server is not initialized";
    }

    nlohmann::json params;
    params["name"] = name;
    params["arguments"] = arguments.is_object() ? arguments : nlohmann::json::object();

    std::string err;
    auto resp = request("tools/call", params, &err);
    if (!resp) {
        std::cerr << "[mcp] tools/call " << name << ": " << err << "\n";
        return "Error: No response from tool server";
    }

    auto rpc_err = extract_rpc_error(*resp);
    if (!rpc_err.empty()) {
        return "Error calling tool: " + rpc_err;
    }

    if (!resp->contains("result") || !(*resp)["result"].is_object()) {
        return "Error: Invalid response from tool server";
    }
    const auto& result = (*resp)["result"];
    if (!result.contains("content") || !result["content"].is_array() ||
        result["content"].empty()) {
        return "Error: Empty content from tool server";
    }

    const auto& first = result["content"][0];
    if (first.is_object() && first.contains("text") && first["text"].is_string()) {
        return first["text"].get<std::string>();
    }
    return "Error: No text content from tool server";
}

std::optional<nlohmann::json> McpClient::request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::string* err) {
    int64_t id = next_id_++;
    nlohmann::json req;
    req["jsonrpc"] = "2.0";
    req["id"] = id;
    req["method"] = method;
    req["params"] = params;

    if (!transport_.write_line(req)) {
        if (err) *err = "failed to write request (pipe closed)";
        return std::nullopt;
    }
    return await_response(id, err);
}

bool McpClient::notify(const std::string& method, const nlohmann::json& params) {
    nlohmann::json note;
    note["jsonrpc"] = "2.0";
    note["method"] = method;
    note["params"] = params;
    return transport_.write_line(note);
}

std::optional<nlohmann::json> McpClient::await_response(int64_t id, std::string* err) {
    int skipped = 0;
    while (true) {
        if (skipped > kMaxSkippedLines) {
            if (err) *err = "no reply after " + std::to_string(kMaxSkippedLines) +
                            " unrelated lines from tool server";
            return std::nullopt;
        }

        ReadResult r = transport_.read_line();

        if (r.status == ReadResult::Status::EndOfStream) {
            if (err) *err = "tool server closed its output";
            return std::nullopt;
        }
        if (r.status == ReadResult::Status::DecodeError) {
            // Garbled JSON-RPC envelope: taken as our reply, which is not resent
            if (r.line.find("\"jsonrpc\"") != std::string::npos ||
                r.line.find("\"id\"") != std::string::npos) {
                std::cerr << "[mcp] Malformed reply: " << truncate_for_log(r.line) << "\n";
                if (err) *err = "malformed reply from tool server: " + r.error;
                return std::nullopt;
            }
            std::cerr << "[mcp] Skipping non-JSON line: " << truncate_for_log(r.line) << "\n";
            skipped++;
            continue;
        }

        const auto& msg = r.document;
        if (!msg.is_object()) {
            std::cerr << "[mcp] Skipping non-object message\n";
            skipped++;
            continue;
        }
        if (!msg.contains("id") || msg["id"].is_null()) {
            // Server notification (logging, progress): nothing to correlate
            skipped++;
            continue;
        }
        if (msg.contains("method")) {
            std::cerr << "[mcp] Ignoring server request '"
                      << msg["method"].dump() << "'\n";
            skipped++;
            continue;
        }
        if (!id_matches(msg["id"], id)) {
            std::cerr << "[mcp] Discarding response for id " << msg["id"].dump()
                      << " (waiting for " << id << ")\n";
            skipped++;
            continue;
        }
        return msg;
    }
}

} // namespace tether
