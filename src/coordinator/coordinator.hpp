#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/step_errors.hpp"
#include "protocol/run_result.hpp"
#include "protocol/step_request.hpp"
#include "runtime/cancel_context.hpp"
#include "runtime/post_writer.hpp"
#include "runtime/runner.hpp"
#include "runtime/waiter.hpp"
#include "signing/signer.hpp"

namespace stepgate::coordinator {

enum class StepState {
    Init,
    WaitPredecessors,
    Substitute,
    EvaluateWhen,
    Run,
    Breakpoint,
    Finalize,
    Success,
    Skipped,
    Continued,
    Errored
};

std::string to_string(StepState state);

struct StepOutcome {
    StepState state = StepState::Success;
    // Exit status of the command; set when it ran to completion.
    std::optional<int> exit_code;
};

// Everything the coordinator talks to. `signer` may be null.
struct Collaborators {
    std::shared_ptr<runtime::Waiter> waiter;
    std::shared_ptr<runtime::Runner> runner;
    std::shared_ptr<runtime::PostWriter> post_writer;
    std::shared_ptr<signing::Signer> signer;
};

// Drives one step: wait for predecessors, resolve references, evaluate
// guards, run the command, then write markers and the termination record.
// The returned error (if any) is the step's classified failure; skips and
// continued failures are successful outcomes.
class Coordinator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Coordinator(protocol::StepExecutionRequest request, Collaborators collaborators,
                Clock clock = std::chrono::system_clock::now);

    core::errors::Result<StepOutcome> run(
        const std::shared_ptr<runtime::CancelContext>& parent =
            runtime::CancelContext::background());

    // The request as the coordinator last saw it (after substitution).
    const protocol::StepExecutionRequest& request() const { return request_; }
    StepState state() const { return state_; }

private:
    // How the step ended, before markers are written.
    struct Verdict {
        StepState terminal = StepState::Success;
        std::optional<core::errors::StepError> error;
        std::optional<std::string> reason;
        std::optional<int> exit_code;
        bool write_post_marker = true;
    };

    void transition(StepState next);
    core::errors::Status init();
    core::errors::Status wait_predecessors(const runtime::CancelContext& ctx);
    core::errors::Status substitute();
    Verdict run_command(const std::shared_ptr<runtime::CancelContext>& step_ctx);
    Verdict classify_run_error(const core::errors::StepError& error);
    Verdict handle_breakpoint(const runtime::CancelContext& ctx);
    core::errors::Result<StepOutcome> finalize(Verdict verdict);
    core::errors::Status write_markers(const Verdict& verdict);
    core::errors::Status write_termination_record(const Verdict& verdict);

    protocol::StepExecutionRequest request_;
    Collaborators collaborators_;
    Clock clock_;
    StepState state_ = StepState::Init;
    std::chrono::system_clock::time_point started_at_;
};

// Exit code the user wrote into a breakpoint-exit marker. Unreadable or
// non-numeric content counts as 0.
int read_breakpoint_exit_code(const std::filesystem::path& path);

}  // namespace stepgate::coordinator
