#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <vector>
#include "bridge/PendingRequest.h"
#include "bridge/ReloadGeneration.h"

/**
 * @brief Bounded FIFO between the listener threads and the host pump
 *
 * Listener threads enqueue and then wait on their own entry; the host thread
 * dequeues. Rejections are synchronous: a full queue or a running build never
 * reaches the host. Every entry that leaves the queue, by any path, gets its
 * completion signal fired exactly once.
 */
class RequestQueue {
public:
    struct EnqueueResult {
        PendingRequestPtr handle;  // null when rejected
        RejectReason reason = RejectReason::None;
        size_t queueSize = 0;

        bool accepted() const { return handle != nullptr; }
    };

    RequestQueue(size_t capacity, ReloadGeneration& generation);

    // Listener side
    EnqueueResult enqueue(BridgePayload payload);
    CompletionStatus waitForCompletion(const PendingRequestPtr& handle, std::chrono::milliseconds timeout);

    // Host side; returns null when empty
    PendingRequestPtr dequeue();

    /**
     * @brief Release every queued entry as Cancelled
     * @return number of entries released
     */
    size_t forceClear();

    /**
     * @brief Advance the reload generation and release every queued entry
     *        as StaleReload, atomically with respect to enqueue()
     */
    size_t onReload();

    /**
     * @brief Enter the building state and release every queued entry as
     *        StaleCompiling; enqueue() rejects until onBuildFinished()
     */
    size_t onBuildStarted();
    void onBuildFinished();

    void setAccepting(bool accepting);
    bool isAccepting() const;
    bool isBuilding() const;
    size_t size() const;
    size_t getCapacity() const { return capacity; }

private:
    size_t releaseAllLocked(std::unique_lock<std::mutex>& lock, CompletionStatus status);

    const size_t capacity;
    ReloadGeneration& generation;

    mutable std::mutex mtx;
    std::deque<PendingRequestPtr> entries;
    bool building = false;
    bool accepting = true;
};
