#include "cancellation.hpp"

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

bool CancellationToken::deadlinePassed() const {
    int64_t deadline = state_->deadline.load(std::memory_order_acquire);
    if (deadline == 0) return false;
    return std::chrono::steady_clock::now().time_since_epoch().count() >= deadline;
}

bool CancellationToken::isCancelled() const {
    return state_->cancelled.load(std::memory_order_acquire) || deadlinePassed();
}

SyncError CancellationToken::error() const {
    if (state_->cancelled.load(std::memory_order_acquire))
        return {ErrorCode::Cancelled, "operation cancelled"};
    if (deadlinePassed())
        return {ErrorCode::DeadlineExceeded, "deadline exceeded"};
    return {};
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel() {
    state_->cancelled.store(true, std::memory_order_release);
}

void CancellationSource::cancelAfter(std::chrono::steady_clock::duration timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int64_t ticks = deadline.time_since_epoch().count();
    // keep 0 free as the "no deadline" marker
    state_->deadline.store(ticks == 0 ? 1 : ticks, std::memory_order_release);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}
