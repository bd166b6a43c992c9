#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "Protocol/retryPolicy.h"
#include "fakeChannel.h"

using namespace std::chrono;

static retryPolicy fastPolicy() {
    retryPolicy policy = retryPolicy::defaults();
    policy.initialBackoff = milliseconds(1);
    policy.maxBackoff = milliseconds(5);
    return policy;
}

// Fails with `code` for the first `failures` calls, then succeeds
static fakeHandler failingThenOk(statusCode code, int failures, std::shared_ptr<int> seen) {
    return [code, failures, seen](const std::string&, const nlohmann::json&, nlohmann::json& response,
                                  const callContext&) -> rpcStatus {
        if ((*seen)++ < failures) return {code, "transient"};
        response = {{"ok", true}};
        return {};
    };
}

static void testDefaults() {
    retryPolicy policy = retryPolicy::defaults();
    assert(policy.maxAttempts == 3);
    assert(policy.isRetryable(statusCode::Unavailable));
    assert(policy.isRetryable(statusCode::DeadlineExceeded));
    assert(!policy.isRetryable(statusCode::Cancelled));
    assert(!policy.isRetryable(statusCode::PermissionDenied));
    assert(!policy.isRetryable(statusCode::Internal));
    assert(!policy.isRetryable(statusCode::Ok));

    assert(policy.backoffFor(1) == milliseconds(100));
    assert(policy.backoffFor(2) == milliseconds(200));
    assert(policy.backoffFor(3) == milliseconds(400));
    assert(policy.backoffFor(4) == milliseconds(800));
    assert(policy.backoffFor(5) == milliseconds(1000));
    assert(policy.backoffFor(12) == milliseconds(1000));

    assert(retryPolicy::none().maxAttempts == 1);
    assert(!retryPolicy::none().isRetryable(statusCode::Unavailable));
}

static void testRetriesTransientFailures() {
    auto stats = std::make_shared<fakeStats>();
    auto seen = std::make_shared<int>(0);
    retryingChannel channel(std::make_unique<fakeChannel>(failingThenOk(statusCode::Unavailable, 2, seen), stats),
                            fastPolicy());

    nlohmann::json response;
    rpcStatus st = channel.call("UserTask/Sign", nlohmann::json::object(), response,
                                callContext::background().withTimeout(seconds(5)));
    assert(st.ok());
    assert(stats->calls == 3);
    assert(response["ok"] == true);

    // DEADLINE_EXCEEDED reported by the peer is retried too
    *seen = 0;
    retryingChannel deadlines(std::make_unique<fakeChannel>(failingThenOk(statusCode::DeadlineExceeded, 1, seen), stats),
                              fastPolicy());
    st = deadlines.call("UserTask/Sign", nlohmann::json::object(), response,
                        callContext::background().withTimeout(seconds(5)));
    assert(st.ok());
    assert(*seen == 2);
}

static void testGivesUpAfterMaxAttempts() {
    auto stats = std::make_shared<fakeStats>();
    auto seen = std::make_shared<int>(0);
    retryingChannel channel(std::make_unique<fakeChannel>(failingThenOk(statusCode::Unavailable, 100, seen), stats),
                            fastPolicy());

    nlohmann::json response;
    rpcStatus st = channel.call("UserTask/Sign", nlohmann::json::object(), response,
                                callContext::background().withTimeout(seconds(5)));
    assert(st.code == statusCode::Unavailable);
    assert(stats->calls == 3);
}

static void testNonRetryableSurfacesImmediately() {
    auto stats = std::make_shared<fakeStats>();
    auto seen = std::make_shared<int>(0);
    retryingChannel channel(std::make_unique<fakeChannel>(failingThenOk(statusCode::PermissionDenied, 1, seen), stats),
                            fastPolicy());

    nlohmann::json response;
    rpcStatus st = channel.call("UserTask/Sign", nlohmann::json::object(), response,
                                callContext::background().withTimeout(seconds(5)));
    assert(st.code == statusCode::PermissionDenied);
    assert(stats->calls == 1);
}

static void testCancellationStopsPendingRetry() {
    auto stats = std::make_shared<fakeStats>();
    auto seen = std::make_shared<int>(0);
    retryPolicy slow = retryPolicy::defaults();
    slow.initialBackoff = seconds(5);
    slow.maxBackoff = seconds(5);
    retryingChannel channel(std::make_unique<fakeChannel>(failingThenOk(statusCode::Unavailable, 100, seen), stats),
                            slow);

    callContext ctx = callContext::background().withCancel();
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(milliseconds(50));
        ctx.cancel();
    });
    auto start = steady_clock::now();
    nlohmann::json response;
    rpcStatus st = channel.call("UserTask/Sign", nlohmann::json::object(), response, ctx);
    auto elapsed = steady_clock::now() - start;
    canceller.join();

    assert(st.code == statusCode::Cancelled);
    assert(stats->calls == 1);
    assert(elapsed < seconds(2));
}

static void testCloseReleasesInner() {
    auto stats = std::make_shared<fakeStats>();
    auto seen = std::make_shared<int>(0);
    {
        retryingChannel channel(std::make_unique<fakeChannel>(failingThenOk(statusCode::Ok, 0, seen), stats),
                                fastPolicy());
        channel.close();
        channel.close();
        nlohmann::json response;
        rpcStatus st = channel.call("UserTask/Sign", nlohmann::json::object(), response, callContext::background());
        assert(st.code == statusCode::Unavailable);
    }
    assert(stats->closes == 1);
    assert(stats->calls == 0);
}

int main() {
    testDefaults();
    testRetriesTransientFailures();
    testGivesUpAfterMaxAttempts();
    testNonRetryableSurfacesImmediately();
    testCancellationStopsPendingRetry();
    testCloseReleasesInner();
    std::cout << "retry policy tests: OK\n";
    return 0;
}
