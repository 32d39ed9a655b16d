#pragma once

#include <chrono>
#include <string>
#include "core/config/defaults.hpp"
#include "core/errors/step_errors.hpp"
#include "runtime/cancel_context.hpp"

namespace stepgate::runtime {

class Waiter {
public:
    virtual ~Waiter() = default;

    // Blocks until `file` exists (and is non-empty when expect_content is set).
    // Returns context_canceled / context_deadline_exceeded when ctx finishes
    // first, and skip_previous_step_failed when `file` + ".err" shows up
    // instead (unless breakpoint_on_failure is set).
    virtual core::errors::Status wait(const CancelContext& ctx,
                                      const std::string& file,
                                      bool expect_content,
                                      bool breakpoint_on_failure) = 0;
};

// Polls the shared volume at a fixed interval.
class FileWaiter : public Waiter {
public:
    explicit FileWaiter(
        std::chrono::milliseconds poll_interval = core::config::kDefaultPollInterval);

    core::errors::Status wait(const CancelContext& ctx, const std::string& file,
                              bool expect_content,
                              bool breakpoint_on_failure) override;

private:
    std::chrono::milliseconds poll_interval_;
};

}  // namespace stepgate::runtime
