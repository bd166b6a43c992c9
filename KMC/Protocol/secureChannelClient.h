#pragma once
#include <openssl/ssl.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include "Protocol/rpcChannel.h"
#include "Protocol/tlsMaterial.h"

// Framed request/response channel over TCP, optionally wrapped in mutual TLS.
// Without initClientContext() the channel stays plain (bootstrap use).
class secureChannelClient : public rpcChannel {
public:
    secureChannelClient();
    ~secureChannelClient() override;

    // Loads own certificate/key and the trusted peer certificate from memory
    bool initClientContext(const tlsMaterial& material, clientError& err);

    // Connect to server over TCP (+ TLS when a context was initialised)
    bool connectToServer(const std::string& address, const callContext& callCtx, clientError& err);
    bool isConnected() const;

    rpcStatus call(const std::string& method, const nlohmann::json& request,
                   nlohmann::json& response, const callContext& callCtx) override;
    void close() override;

private:
    SSL_CTX* ctx;
    SSL* ssl;
    std::atomic<int> server_fd;
    std::string address;
    bool closed;
    uint64_t nextId;
    std::timed_mutex callMutex;

    rpcStatus dial(const callContext& callCtx);
    rpcStatus createSocket(const std::string& host, int port, const callContext& callCtx);
    rpcStatus handshake(const callContext& callCtx);
    rpcStatus sendData(const std::string& data, const callContext& callCtx);
    rpcStatus receiveData(size_t length, std::string& out, const callContext& callCtx);
    void dropConnection();
};
