#pragma once
#include <atomic>
#include <string>
#include <nlohmann/json.hpp>
#include "bridge/BridgeTypes.h"
#include "tools/ToolRegistry.h"

/**
 * @brief JSON-RPC front-end, run on the host thread
 *
 * GET /mcp returns the server status, POST /mcp takes one JSON-RPC 2.0
 * envelope. Tool results are serialized into MCP text content; results
 * larger than maxResponseBytes are replaced by a truncation envelope.
 */
class McpProtocol {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerName = "Tether";
    static constexpr const char* kServerVersion = "1.0.0";

    // JSON-RPC error codes
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kServerInitializing = -32000;

    McpProtocol(ToolRegistry& registry, size_t maxResponseBytes);

    /**
     * @brief Route one HTTP payload for the /mcp endpoint
     */
    BridgeResponse handle(const BridgePayload& payload);

    /**
     * @brief Handle a raw JSON-RPC body
     * @return the response envelope, or null for a notification
     */
    nlohmann::json handleJsonRpc(const std::string& body);

    nlohmann::json statusJson() const;

    /**
     * @brief tools/call: {name, arguments} -> {content:[...], isError?}
     */
    nlohmann::json callTool(const nlohmann::json& params);

    /**
     * @brief Serialize a tool result, truncating it if it is too large
     */
    std::string serializeResult(const std::string& toolName, const nlohmann::json& value) const;

    void setInitialized(bool value) { initialized.store(value); }
    bool isInitialized() const { return initialized.load(); }

    static bool isMcpPath(const std::string& path);
    static std::string normalizePath(const std::string& path);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json textContent(const std::string& text, bool isError);

private:
    ToolRegistry& registry;
    size_t maxResponseBytes;
    std::atomic<bool> initialized{false};
};
