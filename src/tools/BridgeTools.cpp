#include "BridgeTools.h"
#include "ToolRegistry.h"
#include "build/BuildAwaiter.h"
#include <chrono>

namespace {
const int kDefaultBuildWaitMs = 30000;
const int kDefaultReadyWaitMs = 60000;

std::string severityName(BuildMessage::Severity severity) {
    switch (severity) {
        case BuildMessage::Severity::Error: return "error";
        case BuildMessage::Severity::Warning: return "warning";
        default: return "info";
    }
}
} // namespace

// ============================================================================
// WaitForBuildTool
// ============================================================================

WaitForBuildTool::WaitForBuildTool(BuildAwaiter& awaiter) : awaiter(awaiter) {}

std::string WaitForBuildTool::getDescription() const {
    return "Wait for the host build to complete. Use after making code changes.";
}

std::vector<ParamSpec> WaitForBuildTool::getParams() const {
    return {
        {"timeoutMs", "integer", "Maximum wait time in milliseconds (default: 30000)", false}
    };
}

nlohmann::json WaitForBuildTool::execute(const nlohmann::json& args) {
    int timeoutMs = args.value("timeoutMs", kDefaultBuildWaitMs);
    SettleResult result = awaiter.waitUntilSettled(std::chrono::milliseconds(timeoutMs));

    std::string message;
    if (result.timedOut()) {
        message = "Build timed out after " + std::to_string(timeoutMs) + "ms";
    } else if (result.success()) {
        message = result.wasBuilding ? "Build completed successfully" : "No build was needed";
    } else {
        message = "Build failed: " + result.error;
    }

    return {
        {"success", result.success()},
        {"status", settleStatusName(result.status)},
        {"message", message},
        {"wasBuilding", result.wasBuilding},
        {"waitedMs", result.waitedMs},
        {"hasErrors", result.hasErrors},
        {"lastError", result.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.error)},
        {"errorCount", result.errorCount},
        {"warningCount", result.warningCount},
        {"timedOut", result.timedOut()}
    };
}

// ============================================================================
// EnsureReadyTool
// ============================================================================

EnsureReadyTool::EnsureReadyTool(BuildAwaiter& awaiter, std::function<bool()> serverRunning)
    : awaiter(awaiter), serverRunning(std::move(serverRunning)) {}

std::string EnsureReadyTool::getDescription() const {
    return "Block until the host is ready for operations (not building, no errors). Use before important operations.";
}

std::vector<ParamSpec> EnsureReadyTool::getParams() const {
    return {
        {"timeoutMs", "integer", "Maximum wait time (default: 60000)", false},
        {"requireNoErrors", "boolean", "Fail if there are build errors (default: true)", false}
    };
}

nlohmann::json EnsureReadyTool::execute(const nlohmann::json& args) {
    int timeoutMs = args.value("timeoutMs", kDefaultReadyWaitMs);
    bool requireNoErrors = args.value("requireNoErrors", true);

    SettleResult result = awaiter.waitUntilSettled(std::chrono::milliseconds(timeoutMs));

    if (result.timedOut()) {
        return {
            {"success", false},
            {"ready", false},
            {"error", "Timed out waiting for the build to complete"},
            {"waitedMs", result.waitedMs},
            {"stillBuilding", awaiter.isBuilding()}
        };
    }

    if (requireNoErrors && result.hasErrors) {
        return {
            {"success", false},
            {"ready", false},
            {"error", "Build errors present: " + result.error},
            {"hasBuildErrors", true},
            {"waitedMs", result.waitedMs}
        };
    }

    return {
        {"success", true},
        {"ready", true},
        {"message", "Host is ready for operations"},
        {"hasBuildErrors", result.hasErrors},
        {"waitedMs", result.waitedMs},
        {"serverRunning", serverRunning ? serverRunning() : false}
    };
}

// ============================================================================
// BridgeHealthTool
// ============================================================================

BridgeHealthTool::BridgeHealthTool(std::function<nlohmann::json()> probe) : probe(std::move(probe)) {}

std::string BridgeHealthTool::getDescription() const {
    return "Get detailed bridge health and host state for diagnostics.";
}

nlohmann::json BridgeHealthTool::execute(const nlohmann::json& args) {
    (void)args;
    nlohmann::json health = probe ? probe() : nlohmann::json::object();
    health["success"] = true;
    return health;
}

// ============================================================================
// RefreshToolsTool
// ============================================================================

RefreshToolsTool::RefreshToolsTool(ToolRegistry& registry) : registry(registry) {}

std::string RefreshToolsTool::getDescription() const {
    return "Refresh the tool registry to pick up new tools";
}

nlohmann::json RefreshToolsTool::execute(const nlohmann::json& args) {
    (void)args;
    size_t before = registry.getToolCount();
    ToolRegistry::RefreshReport report = registry.refresh();

    nlohmann::json out = {
        {"success", report.complete()},
        {"message", "Tool registry refreshed. " + std::to_string(before) + " -> " +
                    std::to_string(report.toolCount) + " tools"},
        {"toolCount", report.toolCount},
        {"newTools", static_cast<long long>(report.toolCount) - static_cast<long long>(before)},
        {"tools", registry.getToolNames()}
    };
    if (!report.failedSources.empty()) {
        out["failedSources"] = report.failedSources;
    }
    return out;
}

// ============================================================================
// BuildDiagnosticsTool
// ============================================================================

BuildDiagnosticsTool::BuildDiagnosticsTool(BuildAwaiter& awaiter) : awaiter(awaiter) {}

std::string BuildDiagnosticsTool::getDescription() const {
    return "Get recent build errors and warnings";
}

std::vector<ParamSpec> BuildDiagnosticsTool::getParams() const {
    return {
        {"errorsOnly", "boolean", "Only show errors, not warnings (default: false)", false},
        {"clear", "boolean", "Clear after reading (default: false)", false}
    };
}

nlohmann::json BuildDiagnosticsTool::execute(const nlohmann::json& args) {
    bool errorsOnly = args.value("errorsOnly", false);
    bool clear = args.value("clear", false);

    nlohmann::json messages = nlohmann::json::array();
    for (const auto& msg : awaiter.getDiagnostics(errorsOnly)) {
        messages.push_back({
            {"type", severityName(msg.severity)},
            {"message", msg.message},
            {"unit", msg.unit},
            {"file", msg.file},
            {"line", msg.line},
            {"column", msg.column}
        });
    }
    if (clear) {
        awaiter.clearDiagnostics();
    }

    return {
        {"isBuilding", awaiter.isBuilding()},
        {"count", messages.size()},
        {"messages", messages}
    };
}

std::unique_ptr<ToolSet> makeBridgeToolSet(BuildAwaiter& awaiter,
                                           ToolRegistry& registry,
                                           std::function<bool()> serverRunning,
                                           std::function<nlohmann::json()> healthProbe) {
    auto tools = std::make_unique<ToolSet>("bridge");
    tools->add(std::make_shared<WaitForBuildTool>(awaiter));
    tools->add(std::make_shared<EnsureReadyTool>(awaiter, std::move(serverRunning)));
    tools->add(std::make_shared<BridgeHealthTool>(std::move(healthProbe)));
    tools->add(std::make_shared<RefreshToolsTool>(registry));
    tools->add(std::make_shared<BuildDiagnosticsTool>(awaiter));
    return tools;
}
