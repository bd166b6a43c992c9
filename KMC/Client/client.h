#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "Client/appIdClient.h"
#include "Client/configClient.h"
#include "Client/taskClient.h"

// Bootstraps from the configuration service, then signs through the TEE node
// and resolves app-registered keys through the application node.
class client {
public:
    explicit client(const std::string& configServerAddr);
    client(const std::string& configServerAddr, channelDialer dialer);
    ~client();

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    // Fetch config, build TLS material, connect task (and app) clients
    bool init(clientError& err);
    bool init(const callContext& parentCtx, clientError& err);

    std::optional<std::string> sign(const std::string& message, const std::string& publicKey,
                                    uint32_t protocol, uint32_t curve, clientError& err);
    std::optional<appPublicKey> getPublicKeyByAppId(const std::string& appId, clientError& err);
    std::optional<std::string> signWithAppId(const std::string& message, const std::string& appId,
                                             clientError& err);

    uint32_t getNodeId() const;
    const std::optional<nodeConfig>& getConfig() const { return config; }

    // Default timeout for every operation
    void setTimeout(std::chrono::milliseconds timeout);

    bool close();

private:
    channelDialer dialer;
    configClient configCli;
    std::unique_ptr<taskClient> task;
    std::unique_ptr<appIdClient> appIds;
    std::optional<nodeConfig> config;
    std::chrono::milliseconds timeout;
};
