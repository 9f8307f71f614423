#include "bridge/PendingRequest.h"
#include <utility>

PendingRequest::PendingRequest(BridgePayload payload, uint64_t generation)
    : payload(std::move(payload)), generation(generation), createdAt(Clock::now()) {}

std::chrono::milliseconds PendingRequest::getAge(Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - createdAt);
}

bool PendingRequest::complete(CompletionStatus newStatus, BridgeResponse newResponse) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (status != CompletionStatus::Pending) return false;
        status = newStatus;
        response = std::move(newResponse);
    }
    cv.notify_all();
    return true;
}

bool PendingRequest::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, timeout, [this] { return status != CompletionStatus::Pending; });
}

bool PendingRequest::abandon() {
    std::lock_guard<std::mutex> lock(mtx);
    if (status != CompletionStatus::Pending) return false;
    abandoned = true;
    return true;
}

bool PendingRequest::isAbandoned() const {
    std::lock_guard<std::mutex> lock(mtx);
    return abandoned;
}

bool PendingRequest::isCompleted() const {
    std::lock_guard<std::mutex> lock(mtx);
    return status != CompletionStatus::Pending;
}

CompletionStatus PendingRequest::getStatus() const {
    std::lock_guard<std::mutex> lock(mtx);
    return status;
}

BridgeResponse PendingRequest::getResponse() const {
    std::lock_guard<std::mutex> lock(mtx);
    return response;
}
