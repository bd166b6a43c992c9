#include "configClient.h"
#include "Models/constants.h"
#include "Protocol/messages.h"
#include <iostream>
#include <memory>

namespace {

// Closes the bootstrap channel on every exit path
class channelCloser {
public:
    explicit channelCloser(rpcChannel& channel) : channel(channel) {}
    ~channelCloser() { channel.close(); }
    channelCloser(const channelCloser&) = delete;
    channelCloser& operator=(const channelCloser&) = delete;

private:
    rpcChannel& channel;
};

}

configClient::configClient(const std::string& serverAddress)
    : configClient(serverAddress, defaultDialer()) {}

configClient::configClient(const std::string& serverAddress, channelDialer dialer)
    : serverAddress(serverAddress), timeout(DEFAULT_CONFIG_TIMEOUT), dialer(std::move(dialer)) {}

std::optional<nodeConfig> configClient::getConfig(const callContext& parentCtx, clientError& err) {
    callContext callCtx = parentCtx.withTimeout(timeout);

    // Bootstrap traffic is unauthenticated: no TLS material
    std::unique_ptr<rpcChannel> channel = dialer(serverAddress, nullptr, callCtx, err);
    if (!channel) {
        if (!err.isSet()) err.set(errorKind::Connection, "failed to connect to config server " + serverAddress);
        std::cerr << "[ConfigClient] " << err.describe() << "\n";
        return std::nullopt;
    }
    channelCloser closer(*channel);

    return fetchFromServer(*channel, callCtx, err);
}

std::optional<nodeConfig> configClient::fetchFromServer(rpcChannel& channel, const callContext& callCtx,
                                                        clientError& err) {
    nlohmann::json body;
    rpcStatus st = channel.call(METHOD_GET_NODE_INFO, encodeNodeInfoRequest(), body, callCtx);
    if (!st.ok()) {
        err.fromStatus(errorKind::Configuration, "failed to get node info", st);
        std::cerr << "[ConfigClient] " << err.describe() << "\n";
        return std::nullopt;
    }
    nodeInfo info;
    std::string why;
    if (!decodeNodeInfo(body, info, why)) {
        err.set(errorKind::Configuration, "malformed node info", why);
        std::cerr << "[ConfigClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    st = channel.call(METHOD_GET_PEER_NODE, encodePeerNodeRequest(""), body, callCtx);
    if (!st.ok()) {
        err.fromStatus(errorKind::Configuration, "failed to get peer nodes", st);
        std::cerr << "[ConfigClient] " << err.describe() << "\n";
        return std::nullopt;
    }
    std::vector<peerNode> peers;
    if (!decodePeerNodes(body, peers, why)) {
        err.set(errorKind::Configuration, "malformed peer list", why);
        std::cerr << "[ConfigClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    // First TEE node and first app node win; later duplicates are ignored
    const peerNode* teeNode = nullptr;
    const peerNode* appNode = nullptr;
    for (const peerNode& peer : peers) {
        if (peer.type == static_cast<uint32_t>(nodeType::Tee) && !teeNode) {
            teeNode = &peer;
        } else if (peer.type == static_cast<uint32_t>(nodeType::App) && !appNode) {
            appNode = &peer;
        }
        if (teeNode && appNode) break;
    }

    if (!teeNode && !appNode) {
        err.set(errorKind::Configuration, "no TEE or App node found",
                std::to_string(peers.size()) + " peers returned");
        std::cerr << "[ConfigClient] " << err.describe() << "\n";
        return std::nullopt;
    }

    nodeConfig config;
    config.nodeId = info.nodeId;
    config.cert = info.cert;
    config.key = info.key;
    if (teeNode) {
        config.rpcAddress = teeNode->rpcAddress;
        config.targetCert = teeNode->cert;
    }
    if (appNode) {
        config.appNodeAddr = appNode->rpcAddress;
        config.appNodeCert = appNode->cert;
    }

    std::cout << "[ConfigClient] Retrieved config from server, node ID: " << config.nodeId << "\n";
    return config;
}
