#include "ToolRegistry.h"
#include "utils/Logger.h"
#include <chrono>

namespace {
class FunctionToolSource : public IToolSource {
public:
    FunctionToolSource(std::string name, std::function<std::vector<ToolDescriptor>()> enumerate)
        : name(std::move(name)), enumerate(std::move(enumerate)) {}

    std::string getName() const override { return name; }
    std::vector<ToolDescriptor> enumerateTools() override { return enumerate(); }

private:
    std::string name;
    std::function<std::vector<ToolDescriptor>()> enumerate;
};

bool matchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    // "any" and unknown tags are not checked
    return true;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}
} // namespace

ToolResult ToolResult::success(nlohmann::json value) {
    ToolResult result;
    result.ok = true;
    result.value = std::move(value);
    return result;
}

ToolResult ToolResult::failure(ErrorKind kind, const std::string& message, nlohmann::json value) {
    ToolResult result;
    result.ok = false;
    result.kind = kind;
    result.message = message;
    result.value = std::move(value);
    return result;
}

ToolRegistry::ToolRegistry() : ToolRegistry(Options{}) {}

ToolRegistry::ToolRegistry(Options opts)
    : options(std::move(opts)),
      buildToolSet(options.buildTools.begin(), options.buildTools.end()),
      snapshot(std::make_shared<Snapshot>()) {}

void ToolRegistry::registerSource(std::unique_ptr<IToolSource> source) {
    if (!source) return;
    std::lock_guard<std::mutex> lock(sourcesMtx);
    sources.push_back(std::move(source));
}

void ToolRegistry::registerSource(const std::string& name, std::function<std::vector<ToolDescriptor>()> enumerate) {
    if (!enumerate) return;
    registerSource(std::make_unique<FunctionToolSource>(name, std::move(enumerate)));
}

ToolRegistry::RefreshReport ToolRegistry::refresh() {
    RefreshReport report;
    auto next = std::make_shared<Snapshot>();

    {
        std::lock_guard<std::mutex> lock(sourcesMtx);
        for (auto& source : sources) {
            std::vector<ToolDescriptor> descriptors;
            try {
                descriptors = source->enumerateTools();
            } catch (const std::exception& e) {
                Logger::getInstance().warn("[Tether] Failed to enumerate tool source " + source->getName() + ": " + e.what());
                report.failedSources.push_back(source->getName());
                continue;
            } catch (...) {
                Logger::getInstance().warn("[Tether] Failed to enumerate tool source " + source->getName() + ": unknown exception");
                report.failedSources.push_back(source->getName());
                continue;
            }

            for (auto& descriptor : descriptors) {
                if (descriptor.name.empty() || !descriptor.handler) {
                    Logger::getInstance().warn("[Tether] Tool source " + source->getName() +
                                               " produced a tool without name or handler");
                    report.skippedTools.push_back(descriptor.name);
                    continue;
                }
                if (next->byName.count(descriptor.name)) {
                    Logger::getInstance().warn("[Tether] Duplicate tool " + descriptor.name + " from " +
                                               source->getName() + " ignored");
                    report.skippedTools.push_back(descriptor.name);
                    continue;
                }
                auto shared = std::make_shared<const ToolDescriptor>(std::move(descriptor));
                next->byName.emplace(shared->name, shared);
                next->ordered.push_back(std::move(shared));
            }
        }
    }

    report.toolCount = next->ordered.size();
    std::vector<std::string> names;
    names.reserve(next->ordered.size());
    for (const auto& d : next->ordered) names.push_back(d->name);

    {
        std::lock_guard<std::mutex> lock(snapshotMtx);
        snapshot = std::move(next);
    }

    Logger::getInstance().info("[Tether] Registered " + std::to_string(report.toolCount) + " tools: " + joinNames(names));
    return report;
}

std::shared_ptr<const ToolRegistry::Snapshot> ToolRegistry::currentSnapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMtx);
    return snapshot;
}

std::shared_ptr<const ToolDescriptor> ToolRegistry::resolve(const std::string& name) const {
    auto snap = currentSnapshot();
    auto it = snap->byName.find(name);
    if (it == snap->byName.end()) {
        return nullptr;
    }
    return it->second;
}

int ToolRegistry::timeoutFor(const ToolDescriptor& descriptor) const {
    if (descriptor.timeoutMs > 0) return descriptor.timeoutMs;
    return buildToolSet.count(descriptor.name) ? options.buildTimeoutMs : options.defaultTimeoutMs;
}

int ToolRegistry::getToolTimeoutMs(const std::string& name) const {
    auto descriptor = resolve(name);
    if (descriptor) return timeoutFor(*descriptor);
    return buildToolSet.count(name) ? options.buildTimeoutMs : options.defaultTimeoutMs;
}

std::string ToolRegistry::validateArguments(const ToolDescriptor& descriptor, const nlohmann::json& args) {
    if (!args.is_object()) {
        return "Arguments must be a JSON object";
    }
    for (const auto& param : descriptor.params) {
        auto it = args.find(param.name);
        if (it == args.end() || it->is_null()) {
            if (param.required) {
                return "Missing required parameter: " + param.name;
            }
            continue;
        }
        if (!matchesType(param.type, *it)) {
            return "Parameter '" + param.name + "' must be of type " + param.type;
        }
    }
    return "";
}

ToolResult ToolRegistry::invoke(const std::string& name, const nlohmann::json& args) {
    auto tool = resolve(name);
    if (!tool) {
        return ToolResult::failure(ErrorKind::Transport, "Unknown tool: " + name);
    }

    std::string invalid = validateArguments(*tool, args);
    if (!invalid.empty()) {
        return ToolResult::failure(ErrorKind::Transport, invalid);
    }

    const int timeoutMs = timeoutFor(*tool);
    auto start = std::chrono::steady_clock::now();
    ToolResult result;

    // Runs to completion on this thread; the timeout is only checked afterwards.
    try {
        nlohmann::json value = tool->handler(args);
        if (value.is_object() && value.contains("error") && !value["error"].is_null()) {
            const auto& err = value["error"];
            std::string message = err.is_string() ? err.get<std::string>() : err.dump();
            result = ToolResult::failure(ErrorKind::Handler, message, std::move(value));
        } else {
            result = ToolResult::success(std::move(value));
        }
    } catch (const std::exception& e) {
        result = ToolResult::failure(ErrorKind::Handler, e.what());
    } catch (...) {
        result = ToolResult::failure(ErrorKind::Handler, "Tool " + name + " threw a non-standard exception");
    }

    result.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (result.elapsedMs > options.slowThresholdMs) {
        result.slow = true;
        Logger::getInstance().warn("[Tether] Slow tool: " + name + " took " + std::to_string(result.elapsedMs) +
                                   "ms (threshold: " + std::to_string(options.slowThresholdMs) + "ms)");
    }
    if (timeoutMs > 0 && result.elapsedMs > timeoutMs) {
        result.exceededTimeout = true;
        Logger::getInstance().error("[Tether] Tool " + name + " exceeded timeout: " + std::to_string(result.elapsedMs) +
                                    "ms > " + std::to_string(timeoutMs) + "ms");
    }
    if (!result.ok) {
        Logger::getInstance().debug("[Tether] Tool " + name + " failed: " + result.message);
    }
    return result;
}

nlohmann::json ToolRegistry::buildInputSchema(const ToolDescriptor& descriptor) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& param : descriptor.params) {
        nlohmann::json prop;
        // "any" is not a JSON Schema type; omitting "type" accepts every value
        if (param.type != "any") {
            prop["type"] = param.type;
        }
        prop["description"] = param.description;
        properties[param.name] = prop;
        if (param.required) {
            required.push_back(param.name);
        }
    }

    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

nlohmann::json ToolRegistry::listToolSchemas() const {
    nlohmann::json tools = nlohmann::json::array();
    auto snap = currentSnapshot();
    for (const auto& descriptor : snap->ordered) {
        tools.push_back({
            {"name", descriptor->name},
            {"description", descriptor->description},
            {"inputSchema", buildInputSchema(*descriptor)}
        });
    }
    return tools;
}

std::vector<std::string> ToolRegistry::getToolNames() const {
    std::vector<std::string> names;
    auto snap = currentSnapshot();
    names.reserve(snap->ordered.size());
    for (const auto& descriptor : snap->ordered) {
        names.push_back(descriptor->name);
    }
    return names;
}

size_t ToolRegistry::getToolCount() const {
    return currentSnapshot()->ordered.size();
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return resolve(name) != nullptr;
}

void ToolSet::add(std::shared_ptr<ITool> tool) {
    if (!tool) return;
    tools.push_back(std::move(tool));
}

ToolDescriptor ToolSet::describe(const std::shared_ptr<ITool>& tool) {
    ToolDescriptor descriptor;
    descriptor.name = tool->getName();
    descriptor.description = tool->getDescription();
    descriptor.category = tool->getCategory();
    descriptor.readOnly = tool->isReadOnly();
    descriptor.params = tool->getParams();
    descriptor.timeoutMs = tool->getTimeoutMs();
    descriptor.handler = [tool](const nlohmann::json& args) { return tool->execute(args); };
    return descriptor;
}

std::vector<ToolDescriptor> ToolSet::enumerateTools() {
    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(tools.size());
    for (const auto& tool : tools) {
        descriptors.push_back(describe(tool));
    }
    return descriptors;
}
