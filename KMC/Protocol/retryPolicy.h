#pragma once
#include <chrono>
#include <memory>
#include <set>
#include "Models/errors.h"
#include "Protocol/rpcChannel.h"

// Declarative retry configuration for unary calls
struct retryPolicy {
    int maxAttempts;
    std::chrono::milliseconds initialBackoff;
    std::chrono::milliseconds maxBackoff;
    double backoffMultiplier;
    std::set<statusCode> retryableCodes;

    static retryPolicy defaults();
    static retryPolicy none();

    bool isRetryable(statusCode code) const;
    // Delay before retry number `retry` (1 for the first retry)
    std::chrono::milliseconds backoffFor(int retry) const;
};

// Applies a retryPolicy to every call made through the wrapped channel
class retryingChannel : public rpcChannel {
public:
    retryingChannel(std::unique_ptr<rpcChannel> inner, const retryPolicy& policy);
    ~retryingChannel() override;

    rpcStatus call(const std::string& method, const nlohmann::json& request,
                   nlohmann::json& response, const callContext& callCtx) override;
    void close() override;

private:
    std::unique_ptr<rpcChannel> inner;
    retryPolicy policy;
};
