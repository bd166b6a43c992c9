#include "client.h"
#include "Client/protocolUtils.h"
#include "Models/constants.h"
#include "Protocol/wireCodec.h"
#include <iostream>

client::client(const std::string& configServerAddr)
    : client(configServerAddr, defaultDialer()) {}

client::client(const std::string& configServerAddr, channelDialer dialer)
    : dialer(dialer), configCli(configServerAddr, dialer), timeout(DEFAULT_CLIENT_TIMEOUT) {}

client::~client() {
    close();
}

bool client::init(clientError& err) {
    return init(callContext::background(), err);
}

bool client::init(const callContext& parentCtx, clientError& err) {
    close();
    callContext callCtx = parentCtx.withTimeout(timeout);

    // 1. Fetch configuration (without TLS)
    config = configCli.getConfig(callCtx, err);
    if (!config) return false;

    if (config->rpcAddress.empty()) {
        err.set(errorKind::Configuration, "no TEE node in configuration");
        std::cerr << "[Client] " << err.describe() << "\n";
        return false;
    }

    // 2. Connect to TEE server (mutual TLS)
    tlsMaterial teeMaterial;
    if (!createTLSMaterial(config->cert, config->key, config->targetCert, teeMaterial, err)) {
        err.message = "failed to create TEE TLS config: " + err.message;
        return false;
    }
    task = std::make_unique<taskClient>(*config, dialer);
    task->setTimeout(timeout);
    if (!task->connect(callCtx, teeMaterial, err)) {
        return false;
    }

    // 3. Connect to the user management system on the app node, when there is one
    if (!config->appNodeAddr.empty()) {
        tlsMaterial appMaterial;
        if (!createTLSMaterial(config->cert, config->key, config->appNodeCert, appMaterial, err)) {
            err.message = "failed to create App TLS config: " + err.message;
            return false;
        }
        appIds = std::make_unique<appIdClient>(config->appNodeAddr, dialer);
        if (!appIds->connect(callCtx, appMaterial, err)) {
            return false;
        }
    } else {
        std::cout << "[Client] No App node in configuration, app ID lookups disabled\n";
    }

    std::cout << "[Client] Client initialized successfully, node ID: " << config->nodeId << "\n";
    return true;
}

std::optional<std::string> client::sign(const std::string& message, const std::string& publicKey,
                                        uint32_t protocol, uint32_t curve, clientError& err) {
    if (!task) {
        err.set(errorKind::NotConnected, "client not initialized");
        return std::nullopt;
    }
    callContext callCtx = callContext::background().withTimeout(timeout);
    return task->sign(callCtx, message, publicKey, protocol, curve, err);
}

std::optional<appPublicKey> client::getPublicKeyByAppId(const std::string& appId, clientError& err) {
    if (!appIds) {
        err.set(errorKind::NotConnected, "user management client not initialized");
        return std::nullopt;
    }
    callContext callCtx = callContext::background().withTimeout(timeout);
    return appIds->getPublicKeyByAppId(callCtx, appId, err);
}

std::optional<std::string> client::signWithAppId(const std::string& message, const std::string& appId,
                                                 clientError& err) {
    std::optional<appPublicKey> key = getPublicKeyByAppId(appId, err);
    if (!key) {
        err.message = "failed to get public key: " + err.message;
        return std::nullopt;
    }

    std::string publicKey;
    if (!base64Decode(key->publicKey, publicKey)) {
        err.set(errorKind::InvalidArgument, "failed to decode public key", "public key is not valid base64");
        std::cerr << "[Client] " << err.describe() << "\n";
        return std::nullopt;
    }

    return sign(message, publicKey, parseProtocol(key->protocol), parseCurve(key->curve), err);
}

uint32_t client::getNodeId() const {
    return config ? config->nodeId : 0;
}

void client::setTimeout(std::chrono::milliseconds timeout) {
    this->timeout = timeout;
    configCli.setTimeout(timeout);
    if (task) task->setTimeout(timeout);
}

bool client::close() {
    if (task) task->close();
    if (appIds) appIds->close();
    return true;
}
