#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Peer type tags served by the configuration service
enum class nodeType : uint32_t {
    Invalid = 0,
    Tee = 1,
    Mesh = 2,
    App = 3
};

// Resolved configuration snapshot handed from configClient to the other clients
struct nodeConfig {
    uint32_t nodeId = 0;
    std::string rpcAddress;   // TEE peer address
    std::string cert;         // own certificate (PEM)
    std::string key;          // own private key (PEM)
    std::string targetCert;   // TEE peer certificate (PEM)
    std::string appNodeAddr;
    std::string appNodeCert;
};

struct nodeInfo {
    uint32_t nodeId = 0;
    std::string rpcAddress;
    std::string cert;
    std::string key;
};

struct peerNode {
    uint32_t id = 0;
    std::string rpcAddress;
    std::string cert;
    uint32_t type = 0;
};

struct signRequest {
    uint32_t from = 0;
    std::string publicKeyInfo;
    std::string msg;
    uint32_t protocol = 0;
    uint32_t curve = 0;
};

struct signResponse {
    std::string signature;
    bool success = false;
    std::string error;
};

struct appPublicKey {
    std::string publicKey;  // base64, as served
    std::string protocol;
    std::string curve;
};

// nodeConfig <-> JSON, byte blobs base64 encoded
void to_json(nlohmann::json& j, const nodeConfig& config);
void from_json(const nlohmann::json& j, nodeConfig& config);
