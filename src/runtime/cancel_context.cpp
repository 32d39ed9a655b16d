#include "runtime/cancel_context.hpp"

#include <algorithm>

namespace stepgate::runtime {

std::shared_ptr<CancelContext> CancelContext::background() {
    return std::shared_ptr<CancelContext>(new CancelContext());
}

std::shared_ptr<CancelContext> CancelContext::with_cancel(
    const std::shared_ptr<CancelContext>& parent) {
    std::shared_ptr<CancelContext> child(new CancelContext());
    if (!parent) {
        return child;
    }

    std::lock_guard<std::mutex> lock(parent->mutex_);
    child->deadline_ = parent->deadline_;
    const State parent_state = parent->current_state_locked();
    if (parent_state != State::Active) {
        child->state_ = parent_state;
        return child;
    }
    parent->children_.push_back(child);
    return child;
}

std::shared_ptr<CancelContext> CancelContext::with_timeout(
    const std::shared_ptr<CancelContext>& parent,
    const std::chrono::milliseconds timeout) {
    auto child = with_cancel(parent);
    std::lock_guard<std::mutex> lock(child->mutex_);
    const auto now = Clock::now();
    // Saturate instead of overflowing the clock's representation.
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    const auto own_deadline = timeout >= headroom ? Clock::time_point::max() : now + timeout;
    if (!child->deadline_.has_value() || own_deadline < child->deadline_.value()) {
        child->deadline_ = own_deadline;
    }
    return child;
}

void CancelContext::cancel() {
    finish(State::Canceled);
}

void CancelContext::finish(const State cause) {
    std::vector<std::weak_ptr<CancelContext>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_state_locked() != State::Active) {
            return;
        }
        state_ = cause;
        children.swap(children_);
    }
    cv_.notify_all();

    for (const auto& weak_child : children) {
        if (auto child = weak_child.lock()) {
            child->finish(cause);
        }
    }
}

CancelContext::State CancelContext::current_state_locked() const {
    if (state_ == State::Active && deadline_.has_value() &&
        Clock::now() >= deadline_.value()) {
        state_ = State::DeadlineExceeded;
    }
    return state_;
}

bool CancelContext::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_state_locked() != State::Active;
}

std::optional<core::errors::StepError> CancelContext::err() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (current_state_locked()) {
        case State::Canceled:
            return core::errors::context_canceled();
        case State::DeadlineExceeded:
            return core::errors::context_deadline_exceeded();
        default:
            return std::nullopt;
    }
}

std::optional<CancelContext::Clock::time_point> CancelContext::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

bool CancelContext::wait_for(const std::chrono::milliseconds interval) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto until = Clock::now() + interval;
    if (deadline_.has_value()) {
        until = std::min(until, deadline_.value());
    }
    cv_.wait_until(lock, until,
                   [this]() { return current_state_locked() != State::Active; });
    return current_state_locked() != State::Active;
}

}  // namespace stepgate::runtime
