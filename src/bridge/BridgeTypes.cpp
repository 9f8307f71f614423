#include "bridge/BridgeTypes.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Capacity: return "capacity";
        case ErrorKind::Stale: return "stale";
        case ErrorKind::Handler: return "handler";
        case ErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}

BridgeResponse BridgeResponse::json(int status, const nlohmann::json& value) {
    BridgeResponse response;
    response.status = status;
    response.body = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

const char* completionStatusName(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::Pending: return "pending";
        case CompletionStatus::Handled: return "handled";
        case CompletionStatus::StaleReload: return "stale_reload";
        case CompletionStatus::StaleCompiling: return "stale_compiling";
        case CompletionStatus::Expired: return "expired";
        case CompletionStatus::Abandoned: return "abandoned";
        case CompletionStatus::Cancelled: return "cancelled";
        case CompletionStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

ErrorKind errorKindOf(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::Pending:
        case CompletionStatus::Handled:
            return ErrorKind::None;
        case CompletionStatus::StaleReload:
        case CompletionStatus::StaleCompiling:
        case CompletionStatus::Expired:
        case CompletionStatus::Abandoned:
        case CompletionStatus::Cancelled:
            return ErrorKind::Stale;
        case CompletionStatus::TimedOut:
            return ErrorKind::Timeout;
    }
    return ErrorKind::None;
}

const char* rejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::QueueFull: return "queue_full";
        case RejectReason::Building: return "building";
        case RejectReason::NotAccepting: return "not_accepting";
    }
    return "unknown";
}
