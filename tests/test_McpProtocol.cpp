#include <gtest/gtest.h>
#include <string>
#include <nlohmann/json.hpp>

#include "protocol/McpProtocol.h"

namespace {
std::string ExtractText(const nlohmann::json& res, size_t index = 0) {
    if (res.contains("content") && res["content"].is_array() && res["content"].size() > index) {
        const auto& item = res["content"][index];
        if (item.contains("text")) return item["text"].get<std::string>();
    }
    return "";
}

std::string rpc(const std::string& method, const nlohmann::json& params = nlohmann::json::object(), int id = 1) {
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}}.dump();
}
} // namespace

class McpProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.registerSource("test", [] {
            ToolDescriptor echo;
            echo.name = "echo";
            echo.description = "Echo text";
            echo.params = {{"text", "string", "Text", true}};
            echo.handler = [](const nlohmann::json& args) -> nlohmann::json {
                return {{"text", args["text"]}};
            };

            ToolDescriptor big;
            big.name = "big";
            big.description = "Returns a large payload";
            big.handler = [](const nlohmann::json&) -> nlohmann::json {
                return {{"blob", std::string(5000, 'x')}};
            };

            ToolDescriptor failing;
            failing.name = "failing";
            failing.description = "Always fails";
            failing.handler = [](const nlohmann::json&) -> nlohmann::json {
                return {{"error", "nothing selected"}};
            };
            return std::vector<ToolDescriptor>{echo, big, failing};
        });
        registry.refresh();
        protocol.setInitialized(true);
    }

    ToolRegistry registry;
    McpProtocol protocol{registry, 50 * 1024};
};

TEST_F(McpProtocolTest, ParseErrorHasNullId) {
    auto reply = protocol.handleJsonRpc("{not json");
    EXPECT_EQ(reply["error"]["code"], McpProtocol::kParseError);
    EXPECT_TRUE(reply["id"].is_null());
    EXPECT_EQ(reply["jsonrpc"], "2.0");
}

TEST_F(McpProtocolTest, UnknownMethodEchoesId) {
    auto reply = protocol.handleJsonRpc(rpc("frobnicate", nlohmann::json::object(), 42));
    EXPECT_EQ(reply["error"]["code"], McpProtocol::kMethodNotFound);
    EXPECT_EQ(reply["id"], 42);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("frobnicate"), std::string::npos);
}

TEST_F(McpProtocolTest, InitializeReportsServerInfo) {
    auto reply = protocol.handleJsonRpc(rpc("initialize"));
    const auto& result = reply["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["serverInfo"]["name"], "Tether");
    EXPECT_TRUE(result["capabilities"].contains("tools"));
}

TEST_F(McpProtocolTest, ToolsListUsesRegistrySchemas) {
    auto reply = protocol.handleJsonRpc(rpc("tools/list"));
    const auto& tools = reply["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["inputSchema"]["required"], nlohmann::json::array({"text"}));
}

TEST_F(McpProtocolTest, EmptyListsAndPing) {
    EXPECT_TRUE(protocol.handleJsonRpc(rpc("resources/list"))["result"]["resources"].empty());
    EXPECT_TRUE(protocol.handleJsonRpc(rpc("prompts/list"))["result"]["prompts"].empty());
    EXPECT_TRUE(protocol.handleJsonRpc(rpc("ping"))["result"].is_object());
}

TEST_F(McpProtocolTest, RefusesCallsUntilInitialized) {
    protocol.setInitialized(false);
    auto reply = protocol.handleJsonRpc(rpc("tools/list"));
    EXPECT_EQ(reply["error"]["code"], McpProtocol::kServerInitializing);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("initializing"), std::string::npos);

    // GET status still answers
    auto status = protocol.handle(BridgePayload{"GET", "/mcp", ""});
    EXPECT_EQ(status.status, 200);
    auto body = nlohmann::json::parse(status.body);
    EXPECT_EQ(body["status"], "initializing");
    EXPECT_EQ(body["toolCount"], 0);
}

TEST_F(McpProtocolTest, ToolCallReturnsTextContent) {
    auto reply = protocol.handleJsonRpc(rpc("tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}}}}));
    const auto& result = reply["result"];
    EXPECT_FALSE(result.contains("isError"));
    auto payload = nlohmann::json::parse(ExtractText(result));
    EXPECT_EQ(payload["text"], "hi");
}

TEST_F(McpProtocolTest, ToolFailuresAreIsErrorResults) {
    auto unknown = protocol.handleJsonRpc(rpc("tools/call", {{"name", "missing"}}));
    EXPECT_FALSE(unknown.contains("error")) << "unknown tool is a tool-level failure, not a JSON-RPC error";
    EXPECT_EQ(unknown["result"]["isError"], true);
    EXPECT_NE(ExtractText(unknown["result"]).find("Unknown tool"), std::string::npos);

    auto missingArg = protocol.handleJsonRpc(rpc("tools/call", {{"name", "echo"}, {"arguments", nlohmann::json::object()}}));
    EXPECT_EQ(missingArg["result"]["isError"], true);
    EXPECT_EQ(ExtractText(missingArg["result"]), "Error: Missing required parameter: text");

    auto failing = protocol.handleJsonRpc(rpc("tools/call", {{"name", "failing"}}));
    EXPECT_EQ(failing["result"]["isError"], true);
    EXPECT_EQ(ExtractText(failing["result"]), "Error: nothing selected");

    auto noName = protocol.handleJsonRpc(rpc("tools/call", nlohmann::json::object()));
    EXPECT_EQ(ExtractText(noName["result"]), "Error: Tool name required");
}

TEST_F(McpProtocolTest, NonObjectArgumentsAreInvalidParams) {
    auto reply = protocol.handleJsonRpc(rpc("tools/call", {{"name", "echo"}, {"arguments", "text"}}));
    EXPECT_EQ(reply["error"]["code"], McpProtocol::kInvalidParams);
}

TEST_F(McpProtocolTest, OversizedResultIsTruncated) {
    McpProtocol small(registry, 2048);
    small.setInitialized(true);

    auto reply = small.handleJsonRpc(rpc("tools/call", {{"name", "big"}}));
    std::string text = ExtractText(reply["result"]);
    EXPECT_LE(text.size(), 2048u);

    auto envelope = nlohmann::json::parse(text);
    EXPECT_EQ(envelope["_truncated"], true);
    EXPECT_GT(envelope["_originalSize"].get<size_t>(), 5000u);
    EXPECT_EQ(envelope["_maxSize"], 2048);
    EXPECT_FALSE(envelope["_partialData"].get<std::string>().empty());
}

TEST_F(McpProtocolTest, NotificationGets202WithoutBody) {
    BridgePayload payload{"POST", "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})"};
    BridgeResponse response = protocol.handle(payload);
    EXPECT_EQ(response.status, 202);
    EXPECT_TRUE(response.body.empty());
}

TEST_F(McpProtocolTest, RoutesByPath) {
    EXPECT_EQ(protocol.handle(BridgePayload{"GET", "/other", ""}).status, 404);
    EXPECT_EQ(protocol.handle(BridgePayload{"GET", "/", ""}).status, 200);
    EXPECT_EQ(protocol.handle(BridgePayload{"GET", "/mcp/?x=1", ""}).status, 200);

    auto status = nlohmann::json::parse(protocol.handle(BridgePayload{"GET", "/mcp", ""}).body);
    EXPECT_EQ(status["status"], "running");
    EXPECT_EQ(status["toolCount"], 3);
}

TEST_F(McpProtocolTest, ArrayEnvelopeIsInvalidRequest) {
    auto reply = protocol.handleJsonRpc("[1,2,3]");
    EXPECT_EQ(reply["error"]["code"], McpProtocol::kInvalidRequest);
}
