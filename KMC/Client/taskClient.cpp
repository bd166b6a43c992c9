#include "taskClient.h"
#include "Models/constants.h"
#include "Protocol/messages.h"
#include <iostream>

taskClient::taskClient(const nodeConfig& config)
    : taskClient(config, defaultDialer()) {}

taskClient::taskClient(const nodeConfig& config, channelDialer dialer)
    : nodeCfg(config),
      dialer(std::move(dialer)),
      timeout(DEFAULT_TASK_TIMEOUT),
      policy(retryPolicy::defaults()),
      currentState(connectionState::Unconnected) {}

taskClient::~taskClient() {
    close();
}

bool taskClient::connect(const callContext& callCtx, const tlsMaterial& material, clientError& err) {
    if (channel) {
        channel->close();
        channel.reset();
    }
    currentState = connectionState::Unconnected;

    if (nodeCfg.rpcAddress.empty()) {
        err.set(errorKind::Connection, "failed to connect to TEE server", "no TEE node address configured");
        std::cerr << "[TaskClient] " << err.describe() << "\n";
        return false;
    }

    std::unique_ptr<rpcChannel> raw = dialer(nodeCfg.rpcAddress, &material, callCtx, err);
    if (!raw) {
        if (!err.isSet()) err.set(errorKind::Connection, "failed to connect to TEE server " + nodeCfg.rpcAddress);
        std::cerr << "[TaskClient] " << err.describe() << "\n";
        return false;
    }

    channel = std::make_unique<retryingChannel>(std::move(raw), policy);
    currentState = connectionState::Connected;
    std::cout << "[TaskClient] Connected to TEE server " << nodeCfg.rpcAddress << "\n";
    return true;
}

std::optional<std::string> taskClient::sign(const callContext& parentCtx, const std::string& message,
                                            const std::string& publicKey, uint32_t protocol, uint32_t curve,
                                            clientError& err) {
    if (message.empty() || publicKey.empty()) {
        err.set(errorKind::InvalidArgument, "message and public key cannot be empty");
        return std::nullopt;
    }
    if (currentState != connectionState::Connected || !channel) {
        err.set(errorKind::NotConnected, "not connected to server");
        return std::nullopt;
    }

    callContext taskCtx = parentCtx.withTimeout(timeout);

    signRequest request;
    request.from = nodeCfg.nodeId;
    request.publicKeyInfo = publicKey;
    request.msg = message;
    request.protocol = protocol;
    request.curve = curve;

    nlohmann::json body;
    rpcStatus st = channel->call(METHOD_SIGN, encodeSignRequest(request), body, taskCtx);
    if (!st.ok()) {
        err.fromStatus(errorKind::Transport, "rpc call failed [" + statusName(st.code) + "]", st);
        std::cerr << "[TaskClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    signResponse response;
    std::string why;
    if (!decodeSignResponse(body, response, why)) {
        err.set(errorKind::Transport, "malformed sign response", why, statusCode::Internal);
        std::cerr << "[TaskClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    if (!response.success) {
        err.set(errorKind::Signing, "signing failed",
                response.error.empty() ? "unknown error" : response.error);
        std::cerr << "[TaskClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    return response.signature;
}

bool taskClient::close() {
    if (channel) {
        channel->close();
        channel.reset();
        currentState = connectionState::Closed;
        std::cout << "[TaskClient] Connection closed\n";
    }
    return true;
}
