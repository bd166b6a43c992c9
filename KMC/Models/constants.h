#pragma once
#include <chrono>
#include <cstdint>

// Default timeouts
constexpr std::chrono::milliseconds DEFAULT_CLIENT_TIMEOUT{10000};
constexpr std::chrono::milliseconds DEFAULT_CONFIG_TIMEOUT{10000};
constexpr std::chrono::milliseconds DEFAULT_TASK_TIMEOUT{10000};

// Signing protocols
constexpr uint32_t PROTOCOL_ECDSA = 1;
constexpr uint32_t PROTOCOL_SCHNORR = 2;

// Curves
constexpr uint32_t CURVE_ED25519 = 1;
constexpr uint32_t CURVE_SECP256K1 = 2;
constexpr uint32_t CURVE_SECP256R1 = 3;

// Retry policy applied to UserTask and AppIDService calls
constexpr int RETRY_MAX_ATTEMPTS = 3;
constexpr std::chrono::milliseconds RETRY_INITIAL_BACKOFF{100};
constexpr std::chrono::milliseconds RETRY_MAX_BACKOFF{1000};
constexpr double RETRY_BACKOFF_MULTIPLIER = 2.0;

// Remote method names
constexpr const char* METHOD_GET_NODE_INFO = "CLIRPCService/GetNodeInfo";
constexpr const char* METHOD_GET_PEER_NODE = "CLIRPCService/GetPeerNode";
constexpr const char* METHOD_SIGN = "UserTask/Sign";
constexpr const char* METHOD_GET_PUBLIC_KEY_BY_APP_ID = "AppIDService/GetPublicKeyByAppID";

// Largest frame accepted on the wire
constexpr uint32_t MAX_FRAME_BYTES = 16u * 1024u * 1024u;
