#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Error taxonomy shared by every bridge outcome
 *
 * Transport: malformed envelope or unknown method
 * Capacity:  queue full or host building, retry later
 * Stale:     host reloaded, build started or entry expired
 * Handler:   the tool failed
 * Timeout:   the listener gave up waiting for the host
 */
enum class ErrorKind {
    None,
    Transport,
    Capacity,
    Stale,
    Handler,
    Timeout
};

const char* errorKindName(ErrorKind kind);

// One inbound HTTP call as seen by the host thread.
struct BridgePayload {
    std::string method;
    std::string path;
    std::string body;
};

struct BridgeResponse {
    int status = 200;
    std::string body;
    std::string contentType = "application/json";

    static BridgeResponse json(int status, const nlohmann::json& value);
};

// Terminal state of a queued request; Pending until the signal fires.
enum class CompletionStatus {
    Pending,
    Handled,
    StaleReload,
    StaleCompiling,
    Expired,
    Abandoned,
    Cancelled,
    TimedOut
};

const char* completionStatusName(CompletionStatus status);
ErrorKind errorKindOf(CompletionStatus status);

enum class RejectReason {
    None,
    QueueFull,
    Building,
    NotAccepting
};

const char* rejectReasonName(RejectReason reason);
