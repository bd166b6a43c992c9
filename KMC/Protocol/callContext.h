#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include "Models/errors.h"

// Cancellable, deadline-bearing context passed to every blocking operation.
// Copies share state; children see the parent's cancellation and never
// outlive the parent's deadline.
class callContext {
public:
    using clock = std::chrono::steady_clock;

    callContext();

    static callContext background();

    callContext withTimeout(std::chrono::milliseconds timeout) const;
    callContext withCancel() const;

    void cancel() const;
    bool cancelled() const;
    bool expired() const;
    bool done() const;

    std::optional<clock::time_point> deadline() const;
    // Time left before the deadline; max() when there is none
    std::chrono::milliseconds remaining() const;

    // Ok while live, Cancelled or DeadlineExceeded once done
    rpcStatus status() const;

    // Sleeps up to `duration`; returns false if the context finished first
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::optional<clock::time_point> deadline;
        std::shared_ptr<state> parent;
    };

    explicit callContext(std::shared_ptr<state> st);

    std::shared_ptr<state> st;
};
