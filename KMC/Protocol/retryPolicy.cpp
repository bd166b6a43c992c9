#include "retryPolicy.h"
#include "Models/constants.h"
#include <algorithm>
#include <iostream>

retryPolicy retryPolicy::defaults() {
    return retryPolicy{RETRY_MAX_ATTEMPTS, RETRY_INITIAL_BACKOFF, RETRY_MAX_BACKOFF,
                       RETRY_BACKOFF_MULTIPLIER,
                       {statusCode::Unavailable, statusCode::DeadlineExceeded}};
}

retryPolicy retryPolicy::none() {
    return retryPolicy{1, std::chrono::milliseconds(0), std::chrono::milliseconds(0), 1.0, {}};
}

bool retryPolicy::isRetryable(statusCode code) const {
    return retryableCodes.count(code) > 0;
}

std::chrono::milliseconds retryPolicy::backoffFor(int retry) const {
    double delay = static_cast<double>(initialBackoff.count());
    for (int i = 1; i < retry; ++i) {
        delay *= backoffMultiplier;
        if (delay >= static_cast<double>(maxBackoff.count())) break;
    }
    auto ms = std::chrono::milliseconds(static_cast<long long>(delay));
    return std::min(ms, maxBackoff);
}

retryingChannel::retryingChannel(std::unique_ptr<rpcChannel> inner, const retryPolicy& policy)
    : inner(std::move(inner)), policy(policy) {}

retryingChannel::~retryingChannel() {
    close();
}

rpcStatus retryingChannel::call(const std::string& method, const nlohmann::json& request,
                                nlohmann::json& response, const callContext& callCtx) {
    if (!inner) return {statusCode::Unavailable, "channel closed"};

    int attempts = std::max(policy.maxAttempts, 1);
    for (int attempt = 1;; ++attempt) {
        rpcStatus st = inner->call(method, request, response, callCtx);
        if (st.ok() || !policy.isRetryable(st.code) || attempt >= attempts) {
            return st;
        }
        if (callCtx.done()) return callCtx.status();

        auto delay = policy.backoffFor(attempt);
        std::cerr << "[Retry] " << method << " failed " << st.describe()
                  << ", attempt " << attempt << "/" << attempts
                  << ", retrying in " << delay.count() << "ms\n";
        if (!callCtx.sleepFor(delay)) return callCtx.status();
    }
}

void retryingChannel::close() {
    if (inner) {
        inner->close();
        inner.reset();
    }
}
