#include "appIdClient.h"
#include "Models/constants.h"
#include "Protocol/messages.h"
#include <iostream>

appIdClient::appIdClient(const std::string& serverAddress)
    : appIdClient(serverAddress, defaultDialer()) {}

appIdClient::appIdClient(const std::string& serverAddress, channelDialer dialer)
    : serverAddress(serverAddress), dialer(std::move(dialer)), policy(retryPolicy::defaults()) {}

appIdClient::~appIdClient() {
    close();
}

bool appIdClient::connect(const callContext& callCtx, const tlsMaterial& material, clientError& err) {
    close();

    std::unique_ptr<rpcChannel> raw = dialer(serverAddress, &material, callCtx, err);
    if (!raw) {
        if (!err.isSet()) err.set(errorKind::Connection, "failed to connect to user management service " + serverAddress);
        std::cerr << "[AppIdClient] " << err.describe() << "\n";
        return false;
    }
    channel = std::make_unique<retryingChannel>(std::move(raw), policy);
    std::cout << "[AppIdClient] Connected to user management service " << serverAddress << "\n";
    return true;
}

bool appIdClient::close() {
    if (channel) {
        channel->close();
        channel.reset();
    }
    return true;
}

std::optional<appPublicKey> appIdClient::getPublicKeyByAppId(const callContext& callCtx, const std::string& appId,
                                                             clientError& err) {
    if (appId.empty()) {
        err.set(errorKind::InvalidArgument, "app ID cannot be empty");
        return std::nullopt;
    }
    if (!channel) {
        err.set(errorKind::NotConnected, "client not connected");
        return std::nullopt;
    }

    nlohmann::json body;
    rpcStatus st = channel->call(METHOD_GET_PUBLIC_KEY_BY_APP_ID, encodeAppIdRequest(appId), body, callCtx);
    if (!st.ok()) {
        err.fromStatus(errorKind::Transport, "failed to get public key", st);
        std::cerr << "[AppIdClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    appPublicKey key;
    std::string why;
    if (!decodeAppPublicKey(body, key, why)) {
        err.set(errorKind::Transport, "malformed public key response", why, statusCode::Internal);
        std::cerr << "[AppIdClient] " << err.describe() << "\n";
        return std::nullopt;
    }
    if (key.publicKey.empty()) {
        err.set(errorKind::Configuration, "no public key registered for app ID " + appId);
        std::cerr << "[AppIdClient] " << err.describe() << "\n";
        return std::nullopt;
    }
    return key;
}
