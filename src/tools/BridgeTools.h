#pragma once
#include "ITool.h"
#include <functional>
#include <memory>

class BuildAwaiter;
class ToolRegistry;
class ToolSet;

/**
 * @brief Block until the host build settles
 *
 * Polls the build awaiter from the host thread; see
 * BuildAwaiter::waitUntilSettled().
 */
class WaitForBuildTool : public ITool {
public:
    explicit WaitForBuildTool(BuildAwaiter& awaiter);

    std::string getName() const override { return "wait_for_build"; }
    std::string getDescription() const override;
    std::vector<ParamSpec> getParams() const override;
    std::string getCategory() const override { return "Build"; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    BuildAwaiter& awaiter;
};

/**
 * @brief Wait for the build, then report whether the host can take work
 *
 * Fails (error field) on timeout, and on build errors unless
 * requireNoErrors is false.
 */
class EnsureReadyTool : public ITool {
public:
    EnsureReadyTool(BuildAwaiter& awaiter, std::function<bool()> serverRunning);

    std::string getName() const override { return "ensure_ready"; }
    std::string getDescription() const override;
    std::vector<ParamSpec> getParams() const override;
    std::string getCategory() const override { return "Build"; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    BuildAwaiter& awaiter;
    std::function<bool()> serverRunning;
};

class BridgeHealthTool : public ITool {
public:
    explicit BridgeHealthTool(std::function<nlohmann::json()> probe);

    std::string getName() const override { return "bridge_health"; }
    std::string getDescription() const override;
    std::string getCategory() const override { return "Debug"; }
    bool isReadOnly() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::function<nlohmann::json()> probe;
};

class RefreshToolsTool : public ITool {
public:
    explicit RefreshToolsTool(ToolRegistry& registry);

    std::string getName() const override { return "refresh_tools"; }
    std::string getDescription() const override;
    std::string getCategory() const override { return "Debug"; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    ToolRegistry& registry;
};

// Recent compiler errors and warnings, kept across builds
class BuildDiagnosticsTool : public ITool {
public:
    explicit BuildDiagnosticsTool(BuildAwaiter& awaiter);

    std::string getName() const override { return "build_diagnostics"; }
    std::string getDescription() const override;
    std::vector<ParamSpec> getParams() const override;
    std::string getCategory() const override { return "Build"; }
    bool isReadOnly() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    BuildAwaiter& awaiter;
};

std::unique_ptr<ToolSet> makeBridgeToolSet(BuildAwaiter& awaiter,
                                           ToolRegistry& registry,
                                           std::function<bool()> serverRunning,
                                           std::function<nlohmann::json()> healthProbe);
