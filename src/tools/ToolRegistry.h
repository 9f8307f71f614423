#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"
#include "bridge/BridgeTypes.h"

/**
 * @brief Outcome of one tool invocation
 *
 * ok == false carries kind (Transport for unknown tools and bad arguments,
 * Handler for failures inside the tool) and a readable message. value holds
 * the tool payload, or the error payload the tool returned.
 */
struct ToolResult {
    bool ok = false;
    nlohmann::json value;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    long long elapsedMs = 0;
    bool slow = false;
    bool exceededTimeout = false;

    static ToolResult success(nlohmann::json value);
    static ToolResult failure(ErrorKind kind, const std::string& message, nlohmann::json value = nullptr);
};

/**
 * @brief Tool registry
 *
 * Holds an immutable snapshot of descriptors built from the registered
 * sources. refresh() rebuilds the snapshot and swaps it in one step, so a
 * reader sees either the old or the new table, never a mix.
 */
class ToolRegistry {
public:
    struct Options {
        int slowThresholdMs = 2000;
        int defaultTimeoutMs = 15000;
        int buildTimeoutMs = 30000;
        std::vector<std::string> buildTools = {"wait_for_build", "ensure_ready"};
    };

    struct RefreshReport {
        size_t toolCount = 0;
        std::vector<std::string> failedSources;
        std::vector<std::string> skippedTools;

        bool complete() const { return failedSources.empty(); }
    };

    ToolRegistry();
    explicit ToolRegistry(Options options);
    ~ToolRegistry() = default;

    /**
     * @brief Add a descriptor source; takes effect on the next refresh()
     */
    void registerSource(std::unique_ptr<IToolSource> source);
    void registerSource(const std::string& name, std::function<std::vector<ToolDescriptor>()> enumerate);

    /**
     * @brief Re-enumerate all sources and swap in the new snapshot
     *
     * A source that throws is reported in failedSources and contributes
     * nothing; the other sources still publish. Safe to call repeatedly.
     */
    RefreshReport refresh();

    /**
     * @brief Look up a tool
     * @return descriptor, or nullptr if the name is not registered
     */
    std::shared_ptr<const ToolDescriptor> resolve(const std::string& name) const;

    /**
     * @brief Validate arguments and run the tool, timing the call
     *
     * Never throws. Unknown names yield a Transport failure "Unknown tool",
     * thrown handler errors a Handler failure. Slow calls and calls over
     * the tool's timeout are logged after the fact.
     */
    ToolResult invoke(const std::string& name, const nlohmann::json& args);

    /**
     * @brief MCP tool definitions, in registration order
     *
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": {"type": "object", "properties": {...}, "required": [...]}
     *   }
     * ]
     */
    nlohmann::json listToolSchemas() const;

    std::vector<std::string> getToolNames() const;
    size_t getToolCount() const;
    bool hasTool(const std::string& name) const;
    int getToolTimeoutMs(const std::string& name) const;
    const Options& getOptions() const { return options; }

    static nlohmann::json buildInputSchema(const ToolDescriptor& descriptor);

    /**
     * @brief Check required parameters and declared types
     * @return empty string when valid, otherwise the reason
     */
    static std::string validateArguments(const ToolDescriptor& descriptor, const nlohmann::json& args);

private:
    struct Snapshot {
        std::vector<std::shared_ptr<const ToolDescriptor>> ordered;
        std::unordered_map<std::string, std::shared_ptr<const ToolDescriptor>> byName;
    };

    std::shared_ptr<const Snapshot> currentSnapshot() const;
    int timeoutFor(const ToolDescriptor& descriptor) const;

    Options options;
    std::unordered_set<std::string> buildToolSet;

    std::mutex sourcesMtx;
    std::vector<std::unique_ptr<IToolSource>> sources;

    mutable std::mutex snapshotMtx;
    std::shared_ptr<const Snapshot> snapshot;
};

/**
 * @brief IToolSource over a fixed set of ITool objects
 */
class ToolSet : public IToolSource {
public:
    explicit ToolSet(std::string name) : name(std::move(name)) {}

    void add(std::shared_ptr<ITool> tool);

    std::string getName() const override { return name; }
    std::vector<ToolDescriptor> enumerateTools() override;

    static ToolDescriptor describe(const std::shared_ptr<ITool>& tool);

private:
    std::string name;
    std::vector<std::shared_ptr<ITool>> tools;
};
