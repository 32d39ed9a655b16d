#include "coordinator/coordinator.hpp"

#include <charconv>
#include <thread>
#include <utility>
#include "core/config/defaults.hpp"
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"
#include "session/result_collector.hpp"
#include "session/termination_writer.hpp"
#include "substitution/step_substitutor.hpp"
#include "when/when_evaluator.hpp"

namespace stepgate::coordinator {

using core::errors::ErrorCategory;
using core::errors::StepError;
using runtime::CancelContext;

namespace {

// Watches the pod-wide cancellation marker for the lifetime of a step and
// cancels the step context once it shows up.
class CancelWatcher {
public:
    CancelWatcher(std::shared_ptr<runtime::Waiter> waiter, const std::string& cancel_file,
                  std::shared_ptr<CancelContext> step_ctx,
                  std::shared_ptr<CancelContext> watch_ctx)
        : watch_ctx_(std::move(watch_ctx)) {
        if (cancel_file.empty()) {
            return;
        }
        thread_ = std::thread([waiter = std::move(waiter), cancel_file,
                               step_ctx = std::move(step_ctx), watch_ctx = watch_ctx_]() {
            const auto status = waiter->wait(*watch_ctx, cancel_file, true, false);
            if (!core::errors::is_error(status)) {
                LOG_INFO("Cancellation marker " + cancel_file + " observed, stopping step");
                step_ctx->cancel();
            }
        });
    }

    CancelWatcher(const CancelWatcher&) = delete;
    CancelWatcher& operator=(const CancelWatcher&) = delete;

    ~CancelWatcher() { stop(); }

    void stop() {
        watch_ctx_->cancel();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::shared_ptr<CancelContext> watch_ctx_;
    std::thread thread_;
};

bool is_context_error(const StepError& error) {
    return core::errors::is_context_canceled(error) ||
           core::errors::is_context_deadline_exceeded(error);
}

std::string reason_for(const StepError& error) {
    return core::errors::is_context_deadline_exceeded(error) ? protocol::kReasonTimeoutExceeded
                                                             : protocol::kReasonCancelled;
}

bool is_success_state(const StepState state) {
    return state == StepState::Success || state == StepState::Skipped ||
           state == StepState::Continued;
}

}  // namespace

std::string to_string(const StepState state) {
    switch (state) {
        case StepState::Init:
            return "init";
        case StepState::WaitPredecessors:
            return "wait_predecessors";
        case StepState::Substitute:
            return "substitute";
        case StepState::EvaluateWhen:
            return "evaluate_when";
        case StepState::Run:
            return "run";
        case StepState::Breakpoint:
            return "breakpoint";
        case StepState::Finalize:
            return "finalize";
        case StepState::Success:
            return "success";
        case StepState::Skipped:
            return "skipped";
        case StepState::Continued:
            return "continued";
        case StepState::Errored:
            return "errored";
        default:
            return "unknown";
    }
}

int read_breakpoint_exit_code(const std::filesystem::path& path) {
    auto content = core::fs::read_text_file(path);
    if (core::errors::is_error(content)) {
        LOG_WARN("Unable to read breakpoint exit code from " + path.string() +
                 ", assuming 0: " + core::errors::get_error(content).message);
        return 0;
    }

    const auto& text = core::errors::get_value(content);
    const auto first = text.find_first_not_of(" \t\r\n");
    const auto last = text.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return 0;
    }
    const auto trimmed = text.substr(first, last - first + 1);

    int code = 0;
    const auto* begin = trimmed.data();
    const auto* end = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(begin, end, code);
    if (ec != std::errc() || ptr != end) {
        LOG_WARN("Breakpoint exit code \"" + trimmed + "\" is not a number, assuming 0");
        return 0;
    }
    return code;
}

Coordinator::Coordinator(protocol::StepExecutionRequest request, Collaborators collaborators,
                         Clock clock)
    : request_(std::move(request)),
      collaborators_(std::move(collaborators)),
      clock_(std::move(clock)) {}

void Coordinator::transition(const StepState next) {
    LOG_INFO("Coordinator: transition " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

core::errors::Result<StepOutcome> Coordinator::run(
    const std::shared_ptr<CancelContext>& parent) {
    started_at_ = clock_();
    state_ = StepState::Init;

    if (request_.timeout.has_value() && request_.timeout->count() < 0) {
        const StepError error{ErrorCategory::Configuration, "negative timeout specified",
                              "negative_timeout"};
        LOG_ERROR(error.message);
        session::TerminationWriter writer(request_.termination_path);
        if (!request_.termination_path.empty()) {
            auto written = writer.write({{protocol::kStartedAtKey,
                                          session::format_started_at(started_at_),
                                          protocol::ResultType::Internal}});
            if (core::errors::is_error(written)) {
                LOG_ERROR("Unable to write termination message: " +
                          core::errors::get_error(written).message);
            }
        }
        transition(StepState::Errored);
        return error;
    }

    if (!collaborators_.waiter || !collaborators_.runner || !collaborators_.post_writer) {
        return StepError{ErrorCategory::Internal,
                         "Coordinator needs a waiter, a runner and a post writer.",
                         "missing_collaborator"};
    }

    auto step_ctx = CancelContext::with_cancel(parent);
    CancelWatcher watcher(collaborators_.waiter, request_.cancel_file.string(), step_ctx,
                          CancelContext::with_cancel(parent));

    Verdict verdict;
    auto initialized = init();
    if (core::errors::is_error(initialized)) {
        verdict.terminal = StepState::Errored;
        verdict.error = core::errors::get_error(initialized);
        watcher.stop();
        return finalize(std::move(verdict));
    }

    transition(StepState::WaitPredecessors);
    auto waited = wait_predecessors(*step_ctx);
    if (core::errors::is_error(waited)) {
        const auto& error = core::errors::get_error(waited);
        verdict.terminal = StepState::Errored;
        verdict.error = error;
        if (is_context_error(error)) {
            verdict.reason = reason_for(error);
        } else if (core::errors::is_skip_previous_step_failed(error)) {
            LOG_INFO("Skipping step: a previous step failed");
            verdict.reason = protocol::kReasonSkipped;
        } else if (request_.breakpoint_on_failure &&
                   error.code != "debug_before_step_failed") {
            // Leave the markers alone so the step can be inspected.
            verdict.write_post_marker = false;
        }
        watcher.stop();
        return finalize(std::move(verdict));
    }

    transition(StepState::Substitute);
    auto substituted = substitute();
    if (core::errors::is_error(substituted)) {
        verdict.terminal = StepState::Errored;
        verdict.error = core::errors::get_error(substituted);
        watcher.stop();
        return finalize(std::move(verdict));
    }

    transition(StepState::EvaluateWhen);
    auto allowed = when::allow_exec(request_.when);
    if (core::errors::is_error(allowed)) {
        LOG_ERROR("Guard evaluation failed: " + core::errors::get_error(allowed).message);
        verdict.terminal = StepState::Errored;
        verdict.error = core::errors::get_error(allowed);
        watcher.stop();
        return finalize(std::move(verdict));
    }
    if (!core::errors::get_value(allowed)) {
        LOG_INFO("Skipping step: guard expressions evaluated to false");
        verdict.terminal = StepState::Skipped;
        verdict.reason = protocol::kReasonSkipped;
        verdict.exit_code = 0;
        watcher.stop();
        return finalize(std::move(verdict));
    }

    transition(StepState::Run);
    verdict = run_command(step_ctx);
    watcher.stop();
    return finalize(std::move(verdict));
}

// Without a metadata dir this is "artifacts" relative to the working directory.
core::errors::Status Coordinator::init() {
    const auto artifacts_dir = request_.step_metadata_dir / core::config::kArtifactsDirName;
    std::error_code ec;
    std::filesystem::create_directories(artifacts_dir, ec);
    if (ec) {
        return StepError{ErrorCategory::Internal,
                         "Unable to create artifacts directory: " + artifacts_dir.string(),
                         "artifact_dir_create_failed", ec.message()};
    }
    return core::errors::ok();
}

core::errors::Status Coordinator::wait_predecessors(const CancelContext& ctx) {
    for (const auto& file : request_.wait_files) {
        LOG_DEBUG("Waiting for " + file);
        auto status = collaborators_.waiter->wait(ctx, file, request_.wait_file_content,
                                                  request_.breakpoint_on_failure);
        if (core::errors::is_error(status)) {
            return status;
        }
    }

    if (request_.debug_before_step) {
        const auto marker = request_.post_file + core::config::kBeforeStepExitSuffix;
        LOG_INFO("Waiting for before-step debug marker " + marker);
        auto status = collaborators_.waiter->wait(ctx, marker, false,
                                                  request_.breakpoint_on_failure);
        if (core::errors::is_error(status)) {
            if (is_context_error(core::errors::get_error(status))) {
                return status;
            }
            return core::errors::debug_before_step_failed();
        }
    }
    return core::errors::ok();
}

core::errors::Status Coordinator::substitute() {
    substitution::SubstitutionTarget target{request_.command, request_.environment,
                                            request_.when};
    const substitution::StepSubstitutor substitutor(request_.steps_dir);

    auto status = substitutor.apply_result_substitutions(target);
    if (core::errors::is_error(status)) {
        return status;
    }
    status = substitutor.apply_artifact_substitutions(target);
    if (core::errors::is_error(status)) {
        return status;
    }

    request_.command = std::move(target.command);
    request_.environment = std::move(target.environment);
    request_.when = std::move(target.when);
    return core::errors::ok();
}

Coordinator::Verdict Coordinator::run_command(const std::shared_ptr<CancelContext>& step_ctx) {
    const bool has_deadline = request_.timeout.has_value() && request_.timeout->count() > 0;
    auto run_ctx = has_deadline ? CancelContext::with_timeout(step_ctx, request_.timeout.value())
                                : CancelContext::with_cancel(step_ctx);

    core::errors::Status status = core::errors::ok();
    if (auto early = run_ctx->err()) {
        status = early.value();
    } else {
        status = collaborators_.runner->run(*run_ctx, request_.command, request_.environment);
        // Whichever signalled first wins: a context that finished while the
        // command was still running decides the outcome.
        if (auto ctx_err = run_ctx->err()) {
            status = ctx_err.value();
        }
    }
    run_ctx->cancel();

    if (!core::errors::is_error(status)) {
        Verdict verdict;
        verdict.terminal = StepState::Success;
        verdict.exit_code = 0;
        return verdict;
    }

    const auto& error = core::errors::get_error(status);
    if (is_context_error(error)) {
        LOG_WARN("Step stopped: " + error.message);
        Verdict verdict;
        verdict.terminal = StepState::Errored;
        verdict.error = error;
        verdict.reason = reason_for(error);
        return verdict;
    }

    if (request_.breakpoint_on_failure) {
        LOG_WARN("Step failed (" + error.message + "), waiting at breakpoint");
        transition(StepState::Breakpoint);
        return handle_breakpoint(*step_ctx);
    }
    return classify_run_error(error);
}

Coordinator::Verdict Coordinator::classify_run_error(const StepError& error) {
    Verdict verdict;
    if (core::errors::is_exit_error(error) &&
        request_.on_error == protocol::OnErrorPolicy::Continue) {
        LOG_INFO("Ignoring step failure (" + error.message + ") because on-error is continue");
        verdict.terminal = StepState::Continued;
        verdict.exit_code = error.exit_code.value_or(-1);
        return verdict;
    }

    LOG_ERROR("Step failed: " + error.message);
    verdict.terminal = StepState::Errored;
    verdict.error = error;
    verdict.exit_code = error.exit_code;
    return verdict;
}

Coordinator::Verdict Coordinator::handle_breakpoint(const CancelContext& ctx) {
    const auto marker = request_.post_file + core::config::kBreakpointExitSuffix;
    auto status = collaborators_.waiter->wait(ctx, marker, false, true);
    if (core::errors::is_error(status)) {
        const auto& error = core::errors::get_error(status);
        Verdict verdict;
        verdict.terminal = StepState::Errored;
        verdict.error = error;
        if (is_context_error(error)) {
            verdict.reason = reason_for(error);
        }
        return verdict;
    }

    const int code = read_breakpoint_exit_code(marker);
    LOG_INFO("Breakpoint released with exit code " + std::to_string(code));
    if (code == 0) {
        Verdict verdict;
        verdict.terminal = StepState::Success;
        verdict.exit_code = 0;
        return verdict;
    }

    StepError exit_error{ErrorCategory::Run, "exit status " + std::to_string(code), "exit_error"};
    exit_error.exit_code = code;
    return classify_run_error(exit_error);
}

core::errors::Status Coordinator::write_markers(const Verdict& verdict) {
    if (!verdict.write_post_marker) {
        LOG_INFO("Not writing post markers so the step can be debugged");
        return core::errors::ok();
    }

    auto& writer = *collaborators_.post_writer;
    const bool success = !verdict.error.has_value() && is_success_state(verdict.terminal);

    if (!request_.post_file.empty()) {
        const auto marker =
            success ? request_.post_file : request_.post_file + core::config::kErrorSuffix;
        auto written = writer.write(marker, "");
        if (core::errors::is_error(written)) {
            return written;
        }
    }

    if (success) {
        const auto exit_code_file =
            (request_.step_metadata_dir / core::config::kExitCodeFileName).string();
        auto written = writer.write(exit_code_file, std::to_string(verdict.exit_code.value_or(0)));
        if (core::errors::is_error(written)) {
            return written;
        }
    }
    return core::errors::ok();
}

core::errors::Status Coordinator::write_termination_record(const Verdict& verdict) {
    std::vector<protocol::RunResult> entries;
    entries.push_back({protocol::kStartedAtKey, session::format_started_at(started_at_),
                       protocol::ResultType::Internal});
    if (verdict.reason.has_value()) {
        entries.push_back({protocol::kReasonKey, verdict.reason.value(),
                           protocol::ResultType::Internal});
    }
    if (verdict.terminal == StepState::Continued) {
        entries.push_back({protocol::kExitCodeKey, std::to_string(verdict.exit_code.value_or(-1)),
                           protocol::ResultType::Internal});
    }

    const session::ResultCollector collector(request_.results_dir, request_.step_metadata_dir);
    auto report = collector.collect(request_.results, request_.step_results);
    std::optional<StepError> first_error = report.error;
    if (first_error.has_value()) {
        LOG_ERROR("Result collection failed: " + first_error->message);
    }

    std::vector<protocol::RunResult> task_results;
    for (const auto& entry : report.entries) {
        if (entry.result_type == protocol::ResultType::TaskRunResult) {
            task_results.push_back(entry);
        }
    }
    entries.insert(entries.end(), report.entries.begin(), report.entries.end());

    if (collaborators_.signer && !task_results.empty()) {
        auto signatures = collaborators_.signer->sign(task_results);
        if (core::errors::is_error(signatures)) {
            LOG_ERROR("Signing results failed: " + core::errors::get_error(signatures).message);
            if (!first_error.has_value()) {
                first_error = core::errors::get_error(signatures);
            }
        } else {
            const auto& signed_entries = core::errors::get_value(signatures);
            entries.insert(entries.end(), signed_entries.begin(), signed_entries.end());
        }
    }

    if (!request_.termination_path.empty()) {
        const session::TerminationWriter writer(request_.termination_path);
        auto written = writer.write(std::move(entries));
        if (core::errors::is_error(written)) {
            LOG_ERROR("Unable to write termination message: " +
                      core::errors::get_error(written).message);
            if (!first_error.has_value()) {
                first_error = core::errors::get_error(written);
            }
        }
    }

    if (first_error.has_value()) {
        return first_error.value();
    }
    return core::errors::ok();
}

core::errors::Result<StepOutcome> Coordinator::finalize(Verdict verdict) {
    transition(StepState::Finalize);

    auto markers = write_markers(verdict);
    if (core::errors::is_error(markers)) {
        LOG_ERROR("Unable to write post marker: " + core::errors::get_error(markers).message);
    }
    auto record = write_termination_record(verdict);

    if (verdict.error.has_value()) {
        transition(StepState::Errored);
        return verdict.error.value();
    }
    if (core::errors::is_error(markers)) {
        transition(StepState::Errored);
        return core::errors::get_error(markers);
    }
    if (core::errors::is_error(record)) {
        transition(StepState::Errored);
        return core::errors::get_error(record);
    }

    transition(verdict.terminal);
    return StepOutcome{verdict.terminal, verdict.exit_code};
}

}  // namespace stepgate::coordinator
