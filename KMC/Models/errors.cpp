#include "errors.h"

std::string statusName(statusCode code) {
    switch (code) {
        case statusCode::Ok: return "OK";
        case statusCode::Cancelled: return "CANCELLED";
        case statusCode::Unknown: return "UNKNOWN";
        case statusCode::InvalidArgument: return "INVALID_ARGUMENT";
        case statusCode::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case statusCode::NotFound: return "NOT_FOUND";
        case statusCode::AlreadyExists: return "ALREADY_EXISTS";
        case statusCode::PermissionDenied: return "PERMISSION_DENIED";
        case statusCode::ResourceExhausted: return "RESOURCE_EXHAUSTED";
        case statusCode::FailedPrecondition: return "FAILED_PRECONDITION";
        case statusCode::Aborted: return "ABORTED";
        case statusCode::OutOfRange: return "OUT_OF_RANGE";
        case statusCode::Unimplemented: return "UNIMPLEMENTED";
        case statusCode::Internal: return "INTERNAL";
        case statusCode::Unavailable: return "UNAVAILABLE";
        case statusCode::DataLoss: return "DATA_LOSS";
        case statusCode::Unauthenticated: return "UNAUTHENTICATED";
    }
    return "UNKNOWN";
}

statusCode statusFromInt(int value) {
    if (value < 0 || value > static_cast<int>(statusCode::Unauthenticated)) {
        return statusCode::Unknown;
    }
    return static_cast<statusCode>(value);
}

std::string rpcStatus::describe() const {
    if (message.empty()) return "[" + statusName(code) + "]";
    return "[" + statusName(code) + "] " + message;
}

std::string errorKindName(errorKind kind) {
    switch (kind) {
        case errorKind::None: return "no error";
        case errorKind::Connection: return "connection error";
        case errorKind::Configuration: return "configuration error";
        case errorKind::InvalidArgument: return "invalid argument";
        case errorKind::NotConnected: return "not connected";
        case errorKind::Transport: return "transport error";
        case errorKind::Signing: return "signing error";
    }
    return "error";
}

void clientError::set(errorKind k, const std::string& msg, const std::string& why, statusCode code) {
    kind = k;
    message = msg;
    cause = why;
    status = code;
}

void clientError::fromStatus(errorKind k, const std::string& msg, const rpcStatus& st) {
    set(k, msg, st.describe(), st.code);
}

void clientError::clear() {
    set(errorKind::None, "", "", statusCode::Ok);
}

std::string clientError::describe() const {
    std::string out = errorKindName(kind);
    if (!message.empty()) out += ": " + message;
    if (!cause.empty()) out += ": " + cause;
    return out;
}
