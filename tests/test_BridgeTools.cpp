#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <nlohmann/json.hpp>

#include "build/BuildAwaiter.h"
#include "tools/BridgeTools.h"
#include "tools/ToolRegistry.h"

class BridgeToolsTest : public ::testing::Test {
protected:
    BridgeToolsTest() : awaiter(fastOptions()) {}

    static BuildAwaiter::Options fastOptions() {
        BuildAwaiter::Options options;
        options.pollInterval = std::chrono::milliseconds(5);
        options.refreshGrace = std::chrono::milliseconds(5);
        return options;
    }

    void SetUp() override {
        registry.registerSource(makeBridgeToolSet(
            awaiter, registry,
            [] { return true; },
            [] { return nlohmann::json{{"bridge", {{"running", true}}}}; }));
        registry.refresh();
    }

    BuildAwaiter awaiter;
    ToolRegistry registry;
};

TEST_F(BridgeToolsTest, RegistersAllBuiltins) {
    for (const char* name : {"wait_for_build", "ensure_ready", "bridge_health", "refresh_tools", "build_diagnostics"}) {
        EXPECT_TRUE(registry.hasTool(name)) << name;
    }
    EXPECT_EQ(registry.getToolTimeoutMs("wait_for_build"), registry.getOptions().buildTimeoutMs);
    EXPECT_EQ(registry.getToolTimeoutMs("bridge_health"), registry.getOptions().defaultTimeoutMs);
}

TEST_F(BridgeToolsTest, WaitForBuildWithNothingToBuild) {
    ToolResult result = registry.invoke("wait_for_build", {{"timeoutMs", 200}});
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value["success"], true);
    EXPECT_EQ(result.value["status"], "no_build_needed");
    EXPECT_EQ(result.value["wasBuilding"], false);
}

TEST_F(BridgeToolsTest, WaitForBuildReportsFailure) {
    awaiter.onBuildStarted();
    BuildMessage msg;
    msg.file = "Main.cs";
    msg.line = 7;
    msg.column = 1;
    msg.message = "syntax error";
    awaiter.onUnitCompiled("Game", {msg});
    awaiter.onBuildFinished(false);

    ToolResult result = registry.invoke("wait_for_build", nlohmann::json::object());
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value["success"], false);
    EXPECT_EQ(result.value["hasErrors"], true);
    EXPECT_EQ(result.value["errorCount"], 1);
    EXPECT_EQ(result.value["lastError"], "Main.cs(7,1): syntax error");
}

TEST_F(BridgeToolsTest, WaitForBuildTimesOut) {
    awaiter.onBuildStarted();
    ToolResult result = registry.invoke("wait_for_build", {{"timeoutMs", 50}});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.value["timedOut"], true);
    EXPECT_EQ(result.value["success"], false);
}

TEST_F(BridgeToolsTest, EnsureReadyFailsOnBuildErrors) {
    awaiter.onBuildStarted();
    awaiter.onBuildFinished(false);

    ToolResult strict = registry.invoke("ensure_ready", {{"timeoutMs", 500}});
    EXPECT_FALSE(strict.ok);
    EXPECT_EQ(strict.kind, ErrorKind::Handler);
    EXPECT_NE(strict.message.find("Build errors present"), std::string::npos) << strict.message;

    ToolResult lenient = registry.invoke("ensure_ready", {{"timeoutMs", 500}, {"requireNoErrors", false}});
    ASSERT_TRUE(lenient.ok) << lenient.message;
    EXPECT_EQ(lenient.value["ready"], true);
    EXPECT_EQ(lenient.value["hasBuildErrors"], true);
}

TEST_F(BridgeToolsTest, EnsureReadyWaitsForRunningBuild) {
    awaiter.onBuildStarted();
    std::thread pipeline([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        awaiter.onBuildFinished(true);
    });

    ToolResult result = registry.invoke("ensure_ready", {{"timeoutMs", 5000}});
    pipeline.join();

    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value["ready"], true);
    EXPECT_EQ(result.value["serverRunning"], true);
}

TEST_F(BridgeToolsTest, HealthMergesBridgeState) {
    ToolResult result = registry.invoke("bridge_health", nlohmann::json::object());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.value["success"], true);
    EXPECT_EQ(result.value["bridge"]["running"], true);
}

TEST_F(BridgeToolsTest, RefreshPicksUpNewSources) {
    registry.registerSource("late", [] {
        ToolDescriptor d;
        d.name = "late_tool";
        d.description = "Registered after startup";
        d.handler = [](const nlohmann::json&) -> nlohmann::json { return {}; };
        return std::vector<ToolDescriptor>{d};
    });

    ToolResult result = registry.invoke("refresh_tools", nlohmann::json::object());
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value["toolCount"], 6);
    EXPECT_EQ(result.value["newTools"], 1);
    EXPECT_TRUE(registry.hasTool("late_tool"));
}

TEST_F(BridgeToolsTest, DiagnosticsFilterAndClear) {
    awaiter.onBuildStarted();
    BuildMessage err;
    err.message = "broken";
    BuildMessage warn;
    warn.severity = BuildMessage::Severity::Warning;
    warn.message = "deprecated";
    awaiter.onUnitCompiled("Game", {err, warn});
    awaiter.onBuildFinished(false);

    ToolResult all = registry.invoke("build_diagnostics", nlohmann::json::object());
    ASSERT_TRUE(all.ok);
    EXPECT_EQ(all.value["count"], 2);

    ToolResult errors = registry.invoke("build_diagnostics", {{"errorsOnly", true}, {"clear", true}});
    ASSERT_TRUE(errors.ok);
    ASSERT_EQ(errors.value["count"], 1);
    EXPECT_EQ(errors.value["messages"][0]["type"], "error");
    EXPECT_EQ(errors.value["messages"][0]["unit"], "Game");

    ToolResult cleared = registry.invoke("build_diagnostics", nlohmann::json::object());
    EXPECT_EQ(cleared.value["count"], 0);
}
