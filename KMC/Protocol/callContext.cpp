#include "callContext.h"
#include <algorithm>
#include <thread>

// Granularity of interruptible waits
static constexpr std::chrono::milliseconds WAIT_SLICE{10};

callContext::callContext() : st(std::make_shared<state>()) {}

callContext::callContext(std::shared_ptr<state> st) : st(std::move(st)) {}

callContext callContext::background() {
    return callContext();
}

callContext callContext::withTimeout(std::chrono::milliseconds timeout) const {
    auto child = std::make_shared<state>();
    child->parent = st;
    // Saturate so that milliseconds::max() means "no limit of our own"
    clock::time_point now = clock::now();
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - now);
    clock::time_point limit = timeout >= headroom ? clock::time_point::max() : now + timeout;
    std::optional<clock::time_point> inherited = deadline();
    child->deadline = inherited ? std::min(*inherited, limit) : limit;
    return callContext(child);
}

callContext callContext::withCancel() const {
    auto child = std::make_shared<state>();
    child->parent = st;
    child->deadline = deadline();
    return callContext(child);
}

void callContext::cancel() const {
    st->cancelled.store(true);
}

bool callContext::cancelled() const {
    for (const state* s = st.get(); s; s = s->parent.get()) {
        if (s->cancelled.load()) return true;
    }
    return false;
}

bool callContext::expired() const {
    std::optional<clock::time_point> limit = deadline();
    return limit && clock::now() >= *limit;
}

bool callContext::done() const {
    return cancelled() || expired();
}

std::optional<callContext::clock::time_point> callContext::deadline() const {
    return st->deadline;
}

std::chrono::milliseconds callContext::remaining() const {
    std::optional<clock::time_point> limit = deadline();
    if (!limit) return std::chrono::milliseconds::max();
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*limit - clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

rpcStatus callContext::status() const {
    if (cancelled()) return {statusCode::Cancelled, "context cancelled"};
    if (expired()) return {statusCode::DeadlineExceeded, "context deadline exceeded"};
    return {};
}

bool callContext::sleepFor(std::chrono::milliseconds duration) const {
    clock::time_point until = clock::now() + duration;
    while (clock::now() < until) {
        if (done()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - clock::now());
        std::this_thread::sleep_for(std::min(left, WAIT_SLICE));
    }
    return !done();
}
