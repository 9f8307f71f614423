#include "build/BuildAwaiter.h"
#include "utils/Logger.h"
#include <algorithm>
#include <thread>

const char* buildPhaseName(BuildPhase phase) {
    switch (phase) {
        case BuildPhase::Idle: return "idle";
        case BuildPhase::Building: return "building";
        case BuildPhase::Succeeded: return "succeeded";
        case BuildPhase::Failed: return "failed";
    }
    return "unknown";
}

const char* settleStatusName(SettleStatus status) {
    switch (status) {
        case SettleStatus::NoBuildNeeded: return "no_build_needed";
        case SettleStatus::Succeeded: return "succeeded";
        case SettleStatus::Failed: return "failed";
        case SettleStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

std::string BuildMessage::summary() const {
    if (file.empty()) return message;
    return file + "(" + std::to_string(line) + "," + std::to_string(column) + "): " + message;
}

BuildAwaiter::BuildAwaiter() : BuildAwaiter(Options{}) {}

BuildAwaiter::BuildAwaiter(Options options) : options(options) {}

void BuildAwaiter::onBuildStarted() {
    std::lock_guard<std::mutex> lock(mtx);
    phase = BuildPhase::Building;
    firstError.clear();
    errorCount = 0;
    warningCount = 0;
    ++buildsStarted;
}

void BuildAwaiter::onUnitCompiled(const std::string& unit, const std::vector<BuildMessage>& messages) {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& msg : messages) {
        if (msg.severity == BuildMessage::Severity::Error) {
            ++errorCount;
            if (firstError.empty()) {
                firstError = msg.summary();
            }
        } else if (msg.severity == BuildMessage::Severity::Warning) {
            ++warningCount;
        } else {
            continue;
        }

        BuildMessage stored = msg;
        if (stored.unit.empty()) stored.unit = unit;
        diagnostics.push_back(std::move(stored));
        while (diagnostics.size() > options.maxDiagnostics) {
            diagnostics.pop_front();
        }
    }
}

void BuildAwaiter::onBuildFinished(bool succeeded) {
    std::lock_guard<std::mutex> lock(mtx);
    bool failed = !succeeded || errorCount > 0;
    phase = failed ? BuildPhase::Failed : BuildPhase::Succeeded;
    lastBuildFailed = failed;
    if (failed && firstError.empty()) {
        firstError = "Build failed - check the host console for details";
    }
}

void BuildAwaiter::setRefreshHook(Hook hook) {
    std::lock_guard<std::mutex> lock(mtx);
    refreshHook = std::move(hook);
}

void BuildAwaiter::setPollHook(Hook hook) {
    std::lock_guard<std::mutex> lock(mtx);
    pollHook = std::move(hook);
}

SettleResult BuildAwaiter::consumeSettledLocked(bool wasBuilding) {
    SettleResult result;
    result.errorCount = errorCount;
    result.warningCount = warningCount;

    // A phase left over from a build nobody waited on is history, not this wait's outcome
    BuildPhase observed = wasBuilding ? phase : BuildPhase::Idle;
    switch (observed) {
        case BuildPhase::Succeeded:
            result.status = SettleStatus::Succeeded;
            result.wasBuilding = true;
            break;
        case BuildPhase::Failed:
            result.status = SettleStatus::Failed;
            result.wasBuilding = true;
            result.hasErrors = true;
            result.error = firstError;
            break;
        default:
            result.status = SettleStatus::NoBuildNeeded;
            result.wasBuilding = false;
            result.hasErrors = lastBuildFailed;
            if (lastBuildFailed) {
                result.error = firstError.empty() ? "Project has existing build errors" : firstError;
            }
            break;
    }

    // Settled -> Idle once the outcome has been reported
    phase = BuildPhase::Idle;
    return result;
}

SettleResult BuildAwaiter::waitUntilSettled(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const auto deadline = start + std::max(timeout, std::chrono::milliseconds(0));
    auto waited = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    };

    Hook refresh;
    Hook poll;
    bool building = false;
    uint64_t startedBefore = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        refresh = refreshHook;
        poll = pollHook;
        building = phase == BuildPhase::Building;
        startedBefore = buildsStarted;
    }

    if (!building) {
        // Give the host one chance to notice pending changes and start a build.
        if (refresh) refresh();
        auto remaining = deadline - Clock::now();
        auto grace = std::min<Clock::duration>(options.refreshGrace, remaining);
        if (grace > Clock::duration::zero()) {
            std::this_thread::sleep_for(grace);
        }

        std::lock_guard<std::mutex> lock(mtx);
        if (phase != BuildPhase::Building) {
            SettleResult result = consumeSettledLocked(buildsStarted != startedBefore);
            result.waitedMs = waited();
            return result;
        }
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (phase != BuildPhase::Building) {
                SettleResult result = consumeSettledLocked(true);
                result.waitedMs = waited();
                return result;
            }
        }

        if (Clock::now() >= deadline) {
            break;
        }

        if (poll) poll();

        auto remaining = deadline - Clock::now();
        auto nap = std::min<Clock::duration>(options.pollInterval, remaining);
        if (nap > Clock::duration::zero()) {
            std::this_thread::sleep_for(nap);
        }
    }

    SettleResult result;
    result.status = SettleStatus::TimedOut;
    result.wasBuilding = true;
    {
        std::lock_guard<std::mutex> lock(mtx);
        result.errorCount = errorCount;
        result.warningCount = warningCount;
        result.hasErrors = errorCount > 0;
    }
    result.error = "Build timed out after " + std::to_string(timeout.count()) + "ms";
    result.waitedMs = waited();
    Logger::getInstance().warn("[Tether] " + result.error);
    return result;
}

BuildSnapshot BuildAwaiter::getSnapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    BuildSnapshot snap;
    snap.phase = phase;
    snap.firstError = firstError;
    snap.errorCount = errorCount;
    snap.warningCount = warningCount;
    snap.lastBuildFailed = lastBuildFailed;
    snap.buildsStarted = buildsStarted;
    return snap;
}

bool BuildAwaiter::isBuilding() const {
    std::lock_guard<std::mutex> lock(mtx);
    return phase == BuildPhase::Building;
}

bool BuildAwaiter::hasErrors() const {
    std::lock_guard<std::mutex> lock(mtx);
    return lastBuildFailed;
}

std::vector<BuildMessage> BuildAwaiter::getDiagnostics(bool errorsOnly) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<BuildMessage> out;
    for (const auto& msg : diagnostics) {
        if (errorsOnly && msg.severity != BuildMessage::Severity::Error) continue;
        out.push_back(msg);
    }
    return out;
}

void BuildAwaiter::clearDiagnostics() {
    std::lock_guard<std::mutex> lock(mtx);
    diagnostics.clear();
}
