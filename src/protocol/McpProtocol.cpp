#include "protocol/McpProtocol.h"
#include "utils/Logger.h"
#include <algorithm>

namespace {
std::string dumpJson(const nlohmann::json& value, int indent) {
    // Tool output may carry arbitrary bytes; never let serialization throw.
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
} // namespace

McpProtocol::McpProtocol(ToolRegistry& registry, size_t maxResponseBytes)
    : registry(registry), maxResponseBytes(maxResponseBytes) {}

std::string McpProtocol::normalizePath(const std::string& path) {
    std::string out = path;
    auto query = out.find('?');
    if (query != std::string::npos) out.erase(query);
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

bool McpProtocol::isMcpPath(const std::string& path) {
    std::string normalized = normalizePath(path);
    return normalized == "/mcp" || normalized.empty();
}

BridgeResponse McpProtocol::handle(const BridgePayload& payload) {
    if (!isMcpPath(payload.path)) {
        return BridgeResponse::json(404, {{"error", "Not found"}});
    }

    if (payload.method == "POST") {
        nlohmann::json reply = handleJsonRpc(payload.body);
        if (reply.is_null()) {
            BridgeResponse accepted;
            accepted.status = 202;
            return accepted;
        }
        return BridgeResponse::json(200, reply);
    }

    // GET works even before tools are initialized
    return BridgeResponse::json(200, statusJson());
}

nlohmann::json McpProtocol::statusJson() const {
    bool ready = isInitialized();
    nlohmann::json tools = nlohmann::json::array();
    if (ready) {
        for (const auto& name : registry.getToolNames()) tools.push_back(name);
    }
    return {
        {"name", kServerName},
        {"version", kServerVersion},
        {"status", ready ? "running" : "initializing"},
        {"toolCount", tools.size()},
        {"tools", tools}
    };
}

nlohmann::json McpProtocol::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

nlohmann::json McpProtocol::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json McpProtocol::textContent(const std::string& text, bool isError) {
    nlohmann::json out;
    out["content"] = nlohmann::json::array({{{"type", "text"}, {"text", text}}});
    if (isError) {
        out["isError"] = true;
    }
    return out;
}

nlohmann::json McpProtocol::handleJsonRpc(const std::string& body) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return makeError(nullptr, kParseError, "Parse error");
    }

    if (!request.is_object()) {
        return makeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
    if (!request.contains("method") || !request["method"].is_string()) {
        return makeError(id, kInvalidRequest, "Invalid Request: method is required");
    }
    std::string method = request["method"].get<std::string>();

    if (!request.contains("id") && method.rfind("notifications/", 0) == 0) {
        return nullptr;
    }

    if (!isInitialized()) {
        return makeError(id, kServerInitializing, "Server still initializing, please retry");
    }

    nlohmann::json params = nlohmann::json::object();
    if (request.contains("params") && request["params"].is_object()) {
        params = request["params"];
    }

    nlohmann::json result;
    if (method == "initialize") {
        result = {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
        };
    } else if (method == "tools/list") {
        result = {{"tools", registry.listToolSchemas()}};
    } else if (method == "tools/call") {
        if (params.contains("arguments") && !params["arguments"].is_null() && !params["arguments"].is_object()) {
            return makeError(id, kInvalidParams, "Invalid params: arguments must be an object");
        }
        result = callTool(params);
    } else if (method == "resources/list") {
        result = {{"resources", nlohmann::json::array()}};
    } else if (method == "prompts/list") {
        result = {{"prompts", nlohmann::json::array()}};
    } else if (method == "ping") {
        result = nlohmann::json::object();
    } else {
        return makeError(id, kMethodNotFound, "Method not found: " + method);
    }

    return makeResult(id, result);
}

nlohmann::json McpProtocol::callTool(const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string() || params["name"].get<std::string>().empty()) {
        return textContent("Error: Tool name required", true);
    }
    std::string name = params["name"].get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    ToolResult result = registry.invoke(name, arguments);
    if (!result.ok) {
        nlohmann::json reply = textContent("Error: " + result.message, true);
        if (!result.value.is_null()) {
            reply["content"].push_back({{"type", "text"}, {"text", serializeResult(name, result.value)}});
        }
        return reply;
    }

    return textContent(serializeResult(name, result.value), false);
}

std::string McpProtocol::serializeResult(const std::string& toolName, const nlohmann::json& value) const {
    std::string text = dumpJson(value, 2);
    if (text.size() <= maxResponseBytes) {
        return text;
    }

    size_t keep = std::min(maxResponseBytes > 500 ? maxResponseBytes - 500 : 0, text.size());
    nlohmann::json truncated = {
        {"_truncated", true},
        {"_originalSize", text.size()},
        {"_maxSize", maxResponseBytes},
        {"_message", "Response truncated from " + std::to_string(text.size()) + " to " +
                     std::to_string(maxResponseBytes) + " bytes. Use more specific queries or add filters."}
    };

    // Escaping can grow the prefix; shrink it until the envelope fits.
    std::string out;
    while (true) {
        truncated["_partialData"] = text.substr(0, keep);
        out = dumpJson(truncated, 2);
        if (out.size() <= maxResponseBytes || keep == 0) break;
        size_t overshoot = out.size() - maxResponseBytes;
        keep = overshoot >= keep ? 0 : keep - overshoot;
    }

    Logger::getInstance().warn("[Tether] Response for " + toolName + " truncated: " + std::to_string(text.size()) +
                               " > " + std::to_string(maxResponseBytes) + " bytes");
    return out;
}
