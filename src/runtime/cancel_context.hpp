#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "core/errors/step_errors.hpp"

namespace stepgate::runtime {

// Cooperative cancellation shared between the coordinator, the cancel-file
// watcher and whatever operation is in flight. A child context is done as
// soon as its parent is done, or when its own deadline passes.
class CancelContext : public std::enable_shared_from_this<CancelContext> {
public:
    using Clock = std::chrono::steady_clock;

    static std::shared_ptr<CancelContext> background();
    static std::shared_ptr<CancelContext> with_cancel(
        const std::shared_ptr<CancelContext>& parent);
    static std::shared_ptr<CancelContext> with_timeout(
        const std::shared_ptr<CancelContext>& parent,
        std::chrono::milliseconds timeout);

    void cancel();

    bool done() const;

    // context_canceled / context_deadline_exceeded once done, otherwise nullopt.
    std::optional<core::errors::StepError> err() const;

    std::optional<Clock::time_point> deadline() const;

    // Blocks for at most `interval`. Returns true when the context is done.
    bool wait_for(std::chrono::milliseconds interval) const;

private:
    enum class State {
        Active,
        Canceled,
        DeadlineExceeded
    };

    CancelContext() = default;

    void finish(State cause);
    State current_state_locked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable State state_ = State::Active;
    std::optional<Clock::time_point> deadline_;
    std::vector<std::weak_ptr<CancelContext>> children_;
};

}  // namespace stepgate::runtime
