#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "Models/errors.h"
#include "Models/models.h"
#include "Protocol/callContext.h"
#include "Protocol/rpcChannel.h"

// Pulls this node's identity and its TEE/app peers from the configuration
// service over a plain connection opened for the duration of one getConfig.
class configClient {
public:
    explicit configClient(const std::string& serverAddress);
    configClient(const std::string& serverAddress, channelDialer dialer);

    std::optional<nodeConfig> getConfig(const callContext& parentCtx, clientError& err);

    void setTimeout(std::chrono::milliseconds timeout) { this->timeout = timeout; }
    std::chrono::milliseconds getTimeout() const { return timeout; }
    const std::string& getServerAddress() const { return serverAddress; }

private:
    std::string serverAddress;
    std::chrono::milliseconds timeout;
    channelDialer dialer;

    std::optional<nodeConfig> fetchFromServer(rpcChannel& channel, const callContext& callCtx, clientError& err);
};
