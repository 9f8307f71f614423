#include "server/BridgeServer.h"
#include "tools/BridgeTools.h"
#include "utils/Logger.h"
#include "httplib.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
ToolRegistry::Options toolOptions(const Config& config) {
    ToolRegistry::Options options;
    options.slowThresholdMs = config.tools.slowThresholdMs;
    options.defaultTimeoutMs = config.tools.defaultTimeoutMs;
    options.buildTimeoutMs = config.tools.buildTimeoutMs;
    options.buildTools = config.tools.buildTools;
    return options;
}

BuildAwaiter::Options awaiterOptions(const Config& config) {
    BuildAwaiter::Options options;
    options.pollInterval = std::chrono::milliseconds(config.build.pollIntervalMs);
    options.refreshGrace = std::chrono::milliseconds(config.build.refreshGraceMs);
    options.maxDiagnostics = config.build.maxDiagnostics;
    return options;
}

Dispatcher::Options dispatcherOptions(const Config& config) {
    Dispatcher::Options options;
    options.batchSize = config.bridge.batchSize;
    options.staleAge = std::chrono::milliseconds(config.bridge.staleRequestAgeMs);
    return options;
}

std::string utcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string joinPorts(const std::vector<int>& ports) {
    std::string out;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(ports[i]);
    }
    return out;
}

void applyCors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}
} // namespace

BridgeServer::BridgeServer(const Config& config)
    : config(config),
      queue(config.bridge.maxQueueSize, generation),
      registry(toolOptions(config)),
      awaiter(awaiterOptions(config)),
      protocol(registry, config.bridge.maxResponseBytes),
      dispatcher(queue, generation,
                 [this](const BridgePayload& payload) { return protocol.handle(payload); },
                 dispatcherOptions(config)) {
    registry.registerSource(makeBridgeToolSet(
        awaiter, registry,
        [this] { return isRunning(); },
        [this] { return healthJson(); }));
}

BridgeServer::~BridgeServer() {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    stopLocked();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool BridgeServer::start() {
    return start(config.server.port);
}

bool BridgeServer::start(int requestedPort) {
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        if (running.load()) {
            Logger::getInstance().info("[Tether] Server already running on port " + std::to_string(port.load()));
            return true;
        }

        std::vector<int> candidates = {requestedPort};
        if (requestedPort == config.server.port) {
            for (int fallback : config.server.fallbackPorts) {
                if (std::find(candidates.begin(), candidates.end(), fallback) == candidates.end()) {
                    candidates.push_back(fallback);
                }
            }
        }

        for (int candidate : candidates) {
            if (tryStartOn(candidate)) {
                started = true;
                break;
            }
            Logger::getInstance().warn("[Tether] Port " + std::to_string(candidate) + " unavailable");
        }

        if (!started) {
            Logger::getInstance().error("[Tether] Failed to start on any port (tried " + joinPorts(candidates) + ")");
            return false;
        }
    }

    Logger::getInstance().success("[Tether] Server started on http://" + config.server.host + ":" +
                                  std::to_string(port.load()) + "/mcp");
    if (onStarted) onStarted();
    return true;
}

bool BridgeServer::tryStartOn(int candidate) {
    auto server = std::make_unique<httplib::Server>();

    // Every listener thread can block on a queued request; keep one spare
    // so a full queue is answered with a rejection instead of a stall.
    size_t threads = std::max(config.server.listenerThreads, config.bridge.maxQueueSize + 1);
    server->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server->set_keep_alive_max_count(1);

    auto route = [this](const httplib::Request& req, httplib::Response& res) {
        BridgePayload payload{req.method, req.path, req.body};
        BridgeResponse out = handle(payload);
        res.status = out.status;
        applyCors(res);
        if (!out.body.empty()) {
            res.set_content(out.body, out.contentType.c_str());
        }
    };
    server->Get(".*", route);
    server->Post(".*", route);
    server->Options(".*", route);

    int bound = -1;
    if (candidate == 0) {
        bound = server->bind_to_any_port(config.server.host);
    } else if (server->bind_to_port(config.server.host, candidate)) {
        bound = candidate;
    }
    if (bound <= 0) {
        return false;
    }

    http = std::move(server);
    port.store(bound);
    running.store(true);
    queue.setAccepting(true);

    httplib::Server* raw = http.get();
    listenerThread = std::thread([this, raw] {
        if (!raw->listen_after_bind() && running.load()) {
            Logger::getInstance().error("[Tether] Listener on port " + std::to_string(port.load()) + " exited");
        }
    });

    // stop() only interrupts a server that is already accepting
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!raw->is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

void BridgeServer::stop() {
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        wasRunning = stopLocked();
    }
    if (wasRunning) {
        Logger::getInstance().info("[Tether] Server stopped");
        if (onStopped) onStopped();
    }
}

bool BridgeServer::stopLocked() {
    bool wasRunning = running.exchange(false);

    // Refuse new work first so nothing slips in between the clear and the
    // listener shutdown.
    queue.setAccepting(false);
    size_t released = queue.forceClear();
    if (released > 0) {
        Logger::getInstance().info("[Tether] Released " + std::to_string(released) + " pending requests on stop");
    }

    if (http) {
        http->stop();
    }
    if (listenerThread.joinable()) {
        listenerThread.join();
    }
    http.reset();
    protocol.setInitialized(false);
    return wasRunning;
}

bool BridgeServer::restart() {
    int previous = port.load();
    stop();
    return start(previous > 0 ? previous : config.server.port);
}

size_t BridgeServer::forceStop() {
    Logger::getInstance().warn("[Tether] Force stop initiated");
    size_t cleared = queue.forceClear();
    stop();
    Logger::getInstance().info("[Tether] Force stop completed, " + std::to_string(cleared) + " requests released");
    return cleared;
}

size_t BridgeServer::clearQueue() {
    return queue.forceClear();
}

size_t BridgeServer::getToolCount() const {
    return protocol.isInitialized() ? registry.getToolCount() : 0;
}

// ============================================================================
// Host thread
// ============================================================================

size_t BridgeServer::pump() {
    if (!protocol.isInitialized()) {
        tryInitializeTools();
    }
    return dispatcher.pump();
}

bool BridgeServer::tryInitializeTools() {
    ToolRegistry::RefreshReport report = registry.refresh();
    if (!report.complete()) {
        // Retried every tick until the sources enumerate; log once per streak
        if (!initFailureLogged) {
            std::string failed;
            for (const auto& name : report.failedSources) {
                if (!failed.empty()) failed += ", ";
                failed += name;
            }
            Logger::getInstance().warn("[Tether] Tool initialization deferred, sources not ready: " + failed);
            initFailureLogged = true;
        }
        return false;
    }

    initFailureLogged = false;
    protocol.setInitialized(true);
    Logger::getInstance().info("[Tether] Tools initialized (" + std::to_string(report.toolCount) + " tools)");
    return true;
}

void BridgeServer::publishHostStatus(const HostStatus& status) {
    std::lock_guard<std::mutex> lock(hostStatusMtx);
    hostStatus = status;
}

BridgeServer::HostStatus BridgeServer::getHostStatus() const {
    std::lock_guard<std::mutex> lock(hostStatusMtx);
    return hostStatus;
}

// ============================================================================
// Build and reload signals
// ============================================================================

void BridgeServer::onBuildStarted() {
    awaiter.onBuildStarted();
    size_t released = queue.onBuildStarted();
    if (released > 0) {
        Logger::getInstance().warn("[Tether] Build started, released " + std::to_string(released) + " queued requests");
    } else {
        Logger::getInstance().debug("[Tether] Build started");
    }
}

void BridgeServer::onUnitCompiled(const std::string& unit, const std::vector<BuildMessage>& messages) {
    awaiter.onUnitCompiled(unit, messages);
}

void BridgeServer::onBuildFinished(bool succeeded) {
    awaiter.onBuildFinished(succeeded);
    queue.onBuildFinished();
}

void BridgeServer::onReload() {
    size_t released = queue.onReload();
    // Tool sources may have changed; the next pump re-enumerates them
    protocol.setInitialized(false);
    Logger::getInstance().info("[Tether] Host reloaded (generation " + std::to_string(generation.current()) +
                               "), released " + std::to_string(released) + " queued requests");
}

// ============================================================================
// Listener thread
// ============================================================================

BridgeResponse BridgeServer::handle(const BridgePayload& payload) {
    if (payload.method == "OPTIONS") {
        BridgeResponse preflight;
        preflight.contentType = "text/plain";
        return preflight;
    }

    std::string path = McpProtocol::normalizePath(payload.path);
    if (path == "/heartbeat" || path == "/mcp/heartbeat") {
        return BridgeResponse::json(200, heartbeatJson());
    }

    return submit(payload);
}

BridgeResponse BridgeServer::submit(const BridgePayload& payload) {
    RequestQueue::EnqueueResult queued = queue.enqueue(payload);
    if (!queued.accepted()) {
        return rejection(queued.reason, queued.queueSize);
    }

    CompletionStatus status = queue.waitForCompletion(
        queued.handle, std::chrono::milliseconds(config.bridge.requestTimeoutMs));
    if (status == CompletionStatus::Handled) {
        return queued.handle->getResponse();
    }
    return released(status);
}

BridgeResponse BridgeServer::rejection(RejectReason reason, size_t queueSize) const {
    switch (reason) {
        case RejectReason::Building:
            return BridgeResponse::json(503, {
                {"error", "Host is compiling, please retry in a few seconds"},
                {"isCompiling", true},
                {"kind", errorKindName(ErrorKind::Capacity)},
                {"reason", rejectReasonName(reason)}
            });
        case RejectReason::QueueFull:
            Logger::getInstance().warn("[Tether] Request queue full (" + std::to_string(queueSize) + "/" +
                                       std::to_string(queue.getCapacity()) + ")");
            return BridgeResponse::json(503, {
                {"error", "Server busy - request queue full (" + std::to_string(queueSize) + "/" +
                          std::to_string(queue.getCapacity()) + ")"},
                {"hint", "The host may be unresponsive. Try again in a few seconds."},
                {"kind", errorKindName(ErrorKind::Capacity)},
                {"reason", rejectReasonName(reason)}
            });
        default:
            return BridgeResponse::json(503, {
                {"error", "Server is not accepting requests"},
                {"kind", errorKindName(ErrorKind::Capacity)},
                {"reason", rejectReasonName(reason)}
            });
    }
}

BridgeResponse BridgeServer::released(CompletionStatus status) const {
    std::string message;
    switch (status) {
        case CompletionStatus::TimedOut:
            Logger::getInstance().warn("[Tether] Request timed out after " +
                                       std::to_string(config.bridge.requestTimeoutMs) + "ms");
            return BridgeResponse::json(504, {
                {"error", "Request timed out after " + std::to_string(config.bridge.requestTimeoutMs) +
                          "ms waiting for the host thread"},
                {"hint", "The host may be busy, unfocused, reloading, or running a slow operation"},
                {"kind", errorKindName(ErrorKind::Timeout)}
            });
        case CompletionStatus::StaleReload:
            message = "Host reloaded before the request ran, please retry";
            break;
        case CompletionStatus::StaleCompiling:
            message = "Host started compiling before the request ran, please retry";
            break;
        case CompletionStatus::Expired:
            message = "Request expired in the queue before the host could run it";
            break;
        case CompletionStatus::Cancelled:
            message = "Request cancelled, the queue was cleared";
            break;
        default:
            return BridgeResponse::json(500, {
                {"error", std::string("Unexpected request state: ") + completionStatusName(status)}
            });
    }

    nlohmann::json body = {
        {"error", message},
        {"stale", true},
        {"reason", completionStatusName(status)},
        {"kind", errorKindName(errorKindOf(status))}
    };
    if (status == CompletionStatus::StaleCompiling) {
        body["isCompiling"] = true;
    }
    return BridgeResponse::json(503, body);
}

/**
 * Answered without the host thread:
 * {
 *   "ready": bool,
 *   "timestamp": "2024-01-01T00:00:00Z",
 *   "server": {"initialized", "running", "port", "toolCount", "queuedRequests", "reloadGeneration"},
 *   "host": {"isCompiling", "hasErrors", "isPlaying", "isPaused", "focused"},
 *   "capabilities": {"canExecuteTools", "canModifyAssets", "canEnterPlayMode", "canRunTests"}
 * }
 */
nlohmann::json BridgeServer::heartbeatJson() const {
    BuildSnapshot build = awaiter.getSnapshot();
    HostStatus host = getHostStatus();
    bool initialized = protocol.isInitialized();
    bool compiling = build.phase == BuildPhase::Building;
    bool hasErrors = build.lastBuildFailed;
    bool ready = initialized && !compiling && !hasErrors;

    return {
        {"ready", ready},
        {"timestamp", utcTimestamp()},
        {"server", {
            {"initialized", initialized},
            {"running", isRunning()},
            {"port", getPort()},
            {"toolCount", getToolCount()},
            {"queuedRequests", queue.size()},
            {"reloadGeneration", generation.current()}
        }},
        {"host", {
            {"isCompiling", compiling},
            {"hasErrors", hasErrors},
            {"isPlaying", host.isPlaying},
            {"isPaused", host.isPaused},
            {"focused", host.focused}
        }},
        {"capabilities", {
            {"canExecuteTools", ready},
            {"canModifyAssets", ready && !host.isPlaying},
            {"canEnterPlayMode", ready && !host.isPlaying},
            {"canRunTests", ready && !host.isPlaying}
        }}
    };
}

nlohmann::json BridgeServer::healthJson() const {
    BuildSnapshot build = awaiter.getSnapshot();
    HostStatus host = getHostStatus();
    Dispatcher::Stats stats = dispatcher.getStats();
    bool initialized = protocol.isInitialized();
    bool compiling = build.phase == BuildPhase::Building;
    bool ready = initialized && !compiling && !build.lastBuildFailed;

    return {
        {"bridge", {
            {"running", isRunning()},
            {"initialized", initialized},
            {"port", getPort()},
            {"toolCount", getToolCount()},
            {"queuedRequests", queue.size()},
            {"queueCapacity", queue.getCapacity()},
            {"accepting", queue.isAccepting()},
            {"reloadGeneration", generation.current()}
        }},
        {"dispatcher", {
            {"ticks", stats.ticks},
            {"handled", stats.handled},
            {"staleDropped", stats.staleDropped},
            {"expiredDropped", stats.expiredDropped},
            {"abandonedDropped", stats.abandonedDropped},
            {"handlerFaults", stats.handlerFaults}
        }},
        {"build", {
            {"phase", buildPhaseName(build.phase)},
            {"isBuilding", compiling},
            {"lastBuildFailed", build.lastBuildFailed},
            {"lastError", build.firstError.empty() ? nlohmann::json(nullptr) : nlohmann::json(build.firstError)},
            {"errorCount", build.errorCount},
            {"warningCount", build.warningCount},
            {"buildsStarted", build.buildsStarted}
        }},
        {"host", {
            {"isPlaying", host.isPlaying},
            {"isPaused", host.isPaused},
            {"focused", host.focused}
        }},
        {"readiness", {
            {"canExecuteTools", ready},
            {"canModifyAssets", ready && !host.isPlaying},
            {"canEnterPlayMode", ready && !host.isPlaying},
            {"canRunTests", ready && !host.isPlaying}
        }}
    };
}
