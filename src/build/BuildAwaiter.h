#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class BuildPhase {
    Idle,
    Building,
    Succeeded,
    Failed
};

const char* buildPhaseName(BuildPhase phase);

struct BuildMessage {
    enum class Severity { Error, Warning, Info };

    Severity severity = Severity::Error;
    std::string unit;
    std::string file;
    int line = 0;
    int column = 0;
    std::string message;

    // "file(line,column): message"
    std::string summary() const;
};

struct BuildSnapshot {
    BuildPhase phase = BuildPhase::Idle;
    std::string firstError;
    int errorCount = 0;
    int warningCount = 0;
    bool lastBuildFailed = false;
    uint64_t buildsStarted = 0;
};

enum class SettleStatus {
    NoBuildNeeded,
    Succeeded,
    Failed,
    TimedOut
};

const char* settleStatusName(SettleStatus status);

struct SettleResult {
    SettleStatus status = SettleStatus::NoBuildNeeded;
    bool wasBuilding = false;
    bool hasErrors = false;
    std::string error;
    int errorCount = 0;
    int warningCount = 0;
    long long waitedMs = 0;

    bool success() const { return (status == SettleStatus::Succeeded || status == SettleStatus::NoBuildNeeded) && !hasErrors; }
    bool timedOut() const { return status == SettleStatus::TimedOut; }
};

/**
 * @brief Tracks the host's asynchronous build and lets a tool wait for it
 *
 * The build signals may arrive on any thread. waitUntilSettled() is meant
 * for handlers running on the host thread: it polls in short sleeps rather
 * than blocking on a condition, because the finished signal may need that
 * very thread to be delivered. Between sleeps the poll hook gives the host
 * a chance to deliver pending events.
 */
class BuildAwaiter {
public:
    struct Options {
        std::chrono::milliseconds pollInterval{50};
        std::chrono::milliseconds refreshGrace{100};
        size_t maxDiagnostics = 100;
    };

    using Hook = std::function<void()>;

    BuildAwaiter();
    explicit BuildAwaiter(Options options);

    // Build pipeline signals
    void onBuildStarted();
    void onUnitCompiled(const std::string& unit, const std::vector<BuildMessage>& messages);
    void onBuildFinished(bool succeeded);

    /**
     * @brief Asks the host to look for pending changes, which may start a
     *        build. Called once by waitUntilSettled() when idle.
     */
    void setRefreshHook(Hook hook);

    /**
     * @brief Called between poll sleeps while waiting
     */
    void setPollHook(Hook hook);

    /**
     * @brief Wait for the current build to settle
     *
     * Returns NoBuildNeeded when nothing was building and the refresh hook
     * did not start a build. Never blocks longer than timeout plus one poll
     * interval, not counting time spent inside the hooks.
     */
    SettleResult waitUntilSettled(std::chrono::milliseconds timeout);

    BuildSnapshot getSnapshot() const;
    bool isBuilding() const;
    bool hasErrors() const;

    /**
     * @brief Compiler messages of recent builds, oldest first
     */
    std::vector<BuildMessage> getDiagnostics(bool errorsOnly = false) const;
    void clearDiagnostics();

    const Options& getOptions() const { return options; }

private:
    SettleResult consumeSettledLocked(bool wasBuilding);

    Options options;
    Hook refreshHook;
    Hook pollHook;

    mutable std::mutex mtx;
    BuildPhase phase = BuildPhase::Idle;
    std::string firstError;
    int errorCount = 0;
    int warningCount = 0;
    bool lastBuildFailed = false;
    uint64_t buildsStarted = 0;
    std::deque<BuildMessage> diagnostics;
};
