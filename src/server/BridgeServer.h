#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "bridge/BridgeTypes.h"
#include "bridge/Dispatcher.h"
#include "bridge/ReloadGeneration.h"
#include "bridge/RequestQueue.h"
#include "build/BuildAwaiter.h"
#include "protocol/McpProtocol.h"
#include "tools/ToolRegistry.h"

namespace httplib {
    class Server;
}

/**
 * @brief Loopback HTTP bridge into a cooperative host
 *
 * The listener accepts connections at any time; every call that touches
 * host state is queued and only runs inside pump(), which the host calls
 * from its own thread once per tick. The heartbeat is answered directly by
 * the listener from published snapshots so it stays available while the
 * host is busy.
 *
 * Usage:
 *   1. Construct with a Config and register tool sources on getRegistry()
 *   2. start()
 *   3. Call pump() and publishHostStatus() every host tick
 *   4. Forward build and reload events to the on*() methods
 *   5. stop() on shutdown
 */
class BridgeServer {
public:
    struct HostStatus {
        bool isPlaying = false;
        bool isPaused = false;
        bool focused = true;
    };

    explicit BridgeServer(const Config& config);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    /**
     * @brief Start on the configured port, falling back to the configured
     *        fallback ports when it is taken
     */
    bool start();

    /**
     * @brief Start on a specific port; 0 binds an ephemeral port
     */
    bool start(int port);

    void stop();
    bool restart();

    /**
     * @brief Emergency stop: release every queued request, then stop
     * @return number of requests released
     */
    size_t forceStop();

    /**
     * @brief Release every queued request without stopping the server
     */
    size_t clearQueue();

    bool isRunning() const { return running.load(); }
    int getPort() const { return port.load(); }
    bool isInitialized() const { return protocol.isInitialized(); }
    size_t getQueuedRequests() const { return queue.size(); }
    size_t getToolCount() const;

    // Host thread
    size_t pump();
    void publishHostStatus(const HostStatus& status);
    HostStatus getHostStatus() const;

    // Build pipeline and reload signals
    void onBuildStarted();
    void onUnitCompiled(const std::string& unit, const std::vector<BuildMessage>& messages);
    void onBuildFinished(bool succeeded);
    void onReload();

    void setPendingChangeHook(BuildAwaiter::Hook hook) { awaiter.setRefreshHook(std::move(hook)); }
    void setEventPollHook(BuildAwaiter::Hook hook) { awaiter.setPollHook(std::move(hook)); }

    /**
     * @brief Answer one HTTP call; runs on a listener thread and blocks it
     *        until the host has processed the request or the wait expires
     */
    BridgeResponse handle(const BridgePayload& payload);

    nlohmann::json heartbeatJson() const;
    nlohmann::json healthJson() const;

    void setOnStarted(std::function<void()> callback) { onStarted = std::move(callback); }
    void setOnStopped(std::function<void()> callback) { onStopped = std::move(callback); }

    ToolRegistry& getRegistry() { return registry; }
    BuildAwaiter& getBuildAwaiter() { return awaiter; }
    RequestQueue& getQueue() { return queue; }
    const ReloadGeneration& getGeneration() const { return generation; }
    const Dispatcher& getDispatcher() const { return dispatcher; }
    const Config& getConfig() const { return config; }

private:
    bool tryStartOn(int port);
    bool stopLocked();
    bool tryInitializeTools();
    BridgeResponse submit(const BridgePayload& payload);
    BridgeResponse rejection(RejectReason reason, size_t queueSize) const;
    BridgeResponse released(CompletionStatus status) const;

    Config config;
    ReloadGeneration generation;
    RequestQueue queue;
    ToolRegistry registry;
    BuildAwaiter awaiter;
    McpProtocol protocol;
    Dispatcher dispatcher;

    std::mutex lifecycleMtx;
    std::unique_ptr<httplib::Server> http;
    std::thread listenerThread;
    std::atomic<bool> running{false};
    std::atomic<int> port{0};
    bool initFailureLogged = false;

    mutable std::mutex hostStatusMtx;
    HostStatus hostStatus;

    std::function<void()> onStarted;
    std::function<void()> onStopped;
};
