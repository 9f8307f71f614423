#pragma once
#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>

/**
 * @brief Declared parameter of a tool
 *
 * type is a JSON Schema type name ("string", "integer", "number",
 * "boolean", "object", "array") or "any" to accept every value.
 */
struct ParamSpec {
    std::string name;
    std::string type = "string";
    std::string description;
    bool required = true;
};

using ToolHandler = std::function<nlohmann::json(const nlohmann::json&)>;

/**
 * @brief Registration record of one tool
 *
 * timeoutMs == 0 means "use the registry default for this name".
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string category = "General";
    bool readOnly = false;
    std::vector<ParamSpec> params;
    int timeoutMs = 0;
    ToolHandler handler;
};

/**
 * @brief Tool interface
 *
 * Tools run on the host thread only, one at a time. execute() returns the
 * tool's payload; a failure is reported either by throwing or by returning
 * an object with an "error" field:
 * {
 *   "error": "what went wrong"
 * }
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name used by tools/call
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description published through tools/list
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief Declared parameters, in display order
     */
    virtual std::vector<ParamSpec> getParams() const { return {}; }

    virtual std::string getCategory() const { return "General"; }
    virtual bool isReadOnly() const { return false; }
    virtual int getTimeoutMs() const { return 0; }

    /**
     * @brief Run the tool
     * @param args tools/call arguments (always a JSON object)
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};

/**
 * @brief Producer of tool descriptors
 *
 * ToolRegistry::refresh() enumerates every source again, so a source must be
 * able to rebuild its list after a host reload.
 */
class IToolSource {
public:
    virtual ~IToolSource() = default;
    virtual std::string getName() const = 0;
    virtual std::vector<ToolDescriptor> enumerateTools() = 0;
};
