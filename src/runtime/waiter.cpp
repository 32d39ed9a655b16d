#include "runtime/waiter.hpp"

#include <filesystem>
#include <system_error>

namespace stepgate::runtime {

using core::errors::ErrorCategory;
using core::errors::StepError;

FileWaiter::FileWaiter(const std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

core::errors::Status FileWaiter::wait(const CancelContext& ctx,
                                      const std::string& file,
                                      const bool expect_content,
                                      const bool breakpoint_on_failure) {
    if (file.empty()) {
        return core::errors::ok();
    }

    const std::filesystem::path target(file);
    const std::filesystem::path error_marker(file + core::config::kErrorSuffix);
    while (true) {
        if (auto ctx_err = ctx.err()) {
            return ctx_err.value();
        }

        std::error_code ec;
        const bool exists = std::filesystem::exists(target, ec);
        if (ec) {
            return StepError{ErrorCategory::Internal,
                             "waiting for \"" + file + "\": " + ec.message(),
                             "wait_stat_failed"};
        }
        if (exists) {
            if (!expect_content) {
                return core::errors::ok();
            }
            const auto size = std::filesystem::file_size(target, ec);
            if (!ec && size > 0) {
                return core::errors::ok();
            }
        }

        // A predecessor wrote its failure marker instead of its post file.
        if (std::filesystem::exists(error_marker, ec) && !ec) {
            if (breakpoint_on_failure) {
                return core::errors::ok();
            }
            return core::errors::skip_previous_step_failed();
        }

        static_cast<void>(ctx.wait_for(poll_interval_));
    }
}

}  // namespace stepgate::runtime
