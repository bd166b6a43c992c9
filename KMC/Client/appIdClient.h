#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "Models/errors.h"
#include "Models/models.h"
#include "Protocol/callContext.h"
#include "Protocol/retryPolicy.h"
#include "Protocol/rpcChannel.h"
#include "Protocol/tlsMaterial.h"

// Looks up app-registered public keys on the application node
class appIdClient {
public:
    explicit appIdClient(const std::string& serverAddress);
    appIdClient(const std::string& serverAddress, channelDialer dialer);
    ~appIdClient();

    appIdClient(const appIdClient&) = delete;
    appIdClient& operator=(const appIdClient&) = delete;

    bool connect(const callContext& callCtx, const tlsMaterial& material, clientError& err);
    bool close();
    bool isConnected() const { return channel != nullptr; }

    std::optional<appPublicKey> getPublicKeyByAppId(const callContext& callCtx, const std::string& appId,
                                                    clientError& err);

    void setRetryPolicy(const retryPolicy& policy) { this->policy = policy; }

private:
    std::string serverAddress;
    channelDialer dialer;
    std::unique_ptr<rpcChannel> channel;
    retryPolicy policy;
};
