#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "Models/errors.h"
#include "Models/models.h"
#include "Protocol/callContext.h"
#include "Protocol/retryPolicy.h"
#include "Protocol/rpcChannel.h"
#include "Protocol/tlsMaterial.h"

enum class connectionState {
    Unconnected,
    Connected,
    Closed
};

// Executes signing tasks on the TEE node over mutual TLS
class taskClient {
public:
    explicit taskClient(const nodeConfig& config);
    taskClient(const nodeConfig& config, channelDialer dialer);
    ~taskClient();

    taskClient(const taskClient&) = delete;
    taskClient& operator=(const taskClient&) = delete;

    // Replaces any live connection; on failure the client is left Unconnected
    bool connect(const callContext& callCtx, const tlsMaterial& material, clientError& err);

    // Returns the raw signature bytes
    std::optional<std::string> sign(const callContext& parentCtx, const std::string& message,
                                    const std::string& publicKey, uint32_t protocol, uint32_t curve,
                                    clientError& err);

    // Idempotent
    bool close();

    void setTimeout(std::chrono::milliseconds timeout) { this->timeout = timeout; }
    void setRetryPolicy(const retryPolicy& policy) { this->policy = policy; }
    connectionState state() const { return currentState; }
    const nodeConfig& config() const { return nodeCfg; }

private:
    const nodeConfig nodeCfg;
    channelDialer dialer;
    std::unique_ptr<rpcChannel> channel;
    std::chrono::milliseconds timeout;
    retryPolicy policy;
    connectionState currentState;
};
