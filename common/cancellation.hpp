#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include "sync_error.hpp"

// Cooperative cancellation. Nothing is interrupted: long running loops sample
// the token at their own boundaries and stop there.
class CancellationToken {
public:
    // A token that is never cancelled.
    CancellationToken();

    bool isCancelled() const;

    // Cancelled or DeadlineExceeded once the token fired, None before.
    SyncError error() const;

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        // steady_clock ticks, 0 when no deadline is set
        std::atomic<int64_t> deadline{0};
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    bool deadlinePassed() const;

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    void cancel();
    void cancelAfter(std::chrono::steady_clock::duration timeout);

    CancellationToken token() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};
