#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include "bridge/BridgeTypes.h"

/**
 * @brief One inbound call waiting for the host thread
 *
 * Shared between the queue (and later the dispatcher) and the single
 * listener thread blocked on it. complete() fires the completion signal
 * and succeeds exactly once; every later call is a no-op.
 */
class PendingRequest {
public:
    using Clock = std::chrono::steady_clock;

    PendingRequest(BridgePayload payload, uint64_t generation);

    const BridgePayload& getPayload() const { return payload; }
    uint64_t getGeneration() const { return generation; }
    Clock::time_point getCreatedAt() const { return createdAt; }
    std::chrono::milliseconds getAge(Clock::time_point now = Clock::now()) const;

    /**
     * @brief Fire the completion signal
     * @return false if the signal already fired
     */
    bool complete(CompletionStatus status, BridgeResponse response = {});

    /**
     * @brief Block until completion or timeout
     * @return true if the signal fired within the timeout
     */
    bool waitFor(std::chrono::milliseconds timeout);

    /**
     * @brief Mark that the waiting caller gave up
     * @return false if the request completed first, in which case the
     *         caller must use its result instead
     */
    bool abandon();

    bool isAbandoned() const;
    bool isCompleted() const;
    CompletionStatus getStatus() const;
    BridgeResponse getResponse() const;

private:
    BridgePayload payload;
    uint64_t generation;
    Clock::time_point createdAt;

    mutable std::mutex mtx;
    std::condition_variable cv;
    CompletionStatus status = CompletionStatus::Pending;
    BridgeResponse response;
    bool abandoned = false;
};

using PendingRequestPtr = std::shared_ptr<PendingRequest>;
