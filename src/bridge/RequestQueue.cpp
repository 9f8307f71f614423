#include "bridge/RequestQueue.h"
#include "utils/Logger.h"
#include <utility>

RequestQueue::RequestQueue(size_t capacity, ReloadGeneration& generation)
    : capacity(capacity), generation(generation) {}

RequestQueue::EnqueueResult RequestQueue::enqueue(BridgePayload payload) {
    EnqueueResult result;
    std::lock_guard<std::mutex> lock(mtx);
    result.queueSize = entries.size();

    if (!accepting) {
        result.reason = RejectReason::NotAccepting;
        return result;
    }
    if (building) {
        result.reason = RejectReason::Building;
        return result;
    }
    if (entries.size() >= capacity) {
        result.reason = RejectReason::QueueFull;
        return result;
    }

    // Tag read under the queue lock so onReload() cannot interleave.
    result.handle = std::make_shared<PendingRequest>(std::move(payload), generation.current());
    entries.push_back(result.handle);
    result.queueSize = entries.size();
    return result;
}

CompletionStatus RequestQueue::waitForCompletion(const PendingRequestPtr& handle, std::chrono::milliseconds timeout) {
    if (!handle) return CompletionStatus::Cancelled;
    if (handle->waitFor(timeout)) {
        return handle->getStatus();
    }
    if (handle->abandon()) {
        return CompletionStatus::TimedOut;
    }
    // Completed between the wait expiring and the abandon.
    return handle->getStatus();
}

PendingRequestPtr RequestQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mtx);
    if (entries.empty()) return nullptr;
    PendingRequestPtr front = std::move(entries.front());
    entries.pop_front();
    return front;
}

size_t RequestQueue::releaseAllLocked(std::unique_lock<std::mutex>& lock, CompletionStatus status) {
    std::deque<PendingRequestPtr> drained;
    drained.swap(entries);
    lock.unlock();

    for (auto& entry : drained) {
        entry->complete(status);
    }
    return drained.size();
}

size_t RequestQueue::forceClear() {
    std::unique_lock<std::mutex> lock(mtx);
    size_t cleared = releaseAllLocked(lock, CompletionStatus::Cancelled);
    if (cleared > 0) {
        Logger::getInstance().warn("[Tether] Cleared " + std::to_string(cleared) + " pending requests from queue");
    }
    return cleared;
}

size_t RequestQueue::onReload() {
    std::unique_lock<std::mutex> lock(mtx);
    uint64_t next = generation.advance();
    size_t released = releaseAllLocked(lock, CompletionStatus::StaleReload);
    Logger::getInstance().debug("[Tether] Reload generation " + std::to_string(next) +
                                ", released " + std::to_string(released) + " stale requests");
    return released;
}

size_t RequestQueue::onBuildStarted() {
    std::unique_lock<std::mutex> lock(mtx);
    building = true;
    return releaseAllLocked(lock, CompletionStatus::StaleCompiling);
}

void RequestQueue::onBuildFinished() {
    std::lock_guard<std::mutex> lock(mtx);
    building = false;
}

void RequestQueue::setAccepting(bool value) {
    std::lock_guard<std::mutex> lock(mtx);
    accepting = value;
}

bool RequestQueue::isAccepting() const {
    std::lock_guard<std::mutex> lock(mtx);
    return accepting;
}

bool RequestQueue::isBuilding() const {
    std::lock_guard<std::mutex> lock(mtx);
    return building;
}

size_t RequestQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}
