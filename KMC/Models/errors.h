#pragma once
#include <string>

// Transport status codes, numerically identical to gRPC's
enum class statusCode : int {
    Ok = 0,
    Cancelled = 1,
    Unknown = 2,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    NotFound = 5,
    AlreadyExists = 6,
    PermissionDenied = 7,
    ResourceExhausted = 8,
    FailedPrecondition = 9,
    Aborted = 10,
    OutOfRange = 11,
    Unimplemented = 12,
    Internal = 13,
    Unavailable = 14,
    DataLoss = 15,
    Unauthenticated = 16
};

std::string statusName(statusCode code);
statusCode statusFromInt(int value);

// Outcome of one remote call
struct rpcStatus {
    statusCode code = statusCode::Ok;
    std::string message;

    bool ok() const { return code == statusCode::Ok; }
    std::string describe() const;
};

enum class errorKind {
    None,
    Connection,
    Configuration,
    InvalidArgument,
    NotConnected,
    Transport,
    Signing
};

std::string errorKindName(errorKind kind);

// Error reported through the clients' out-parameters
struct clientError {
    errorKind kind = errorKind::None;
    std::string message;
    std::string cause;
    statusCode status = statusCode::Ok;

    bool isSet() const { return kind != errorKind::None; }
    void set(errorKind k, const std::string& msg, const std::string& why = "",
             statusCode code = statusCode::Ok);
    void fromStatus(errorKind k, const std::string& msg, const rpcStatus& st);
    void clear();
    std::string describe() const;
};
