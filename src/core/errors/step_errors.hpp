#pragma once
#include <optional>
#include <string>
#include <variant>

namespace stepgate::core::errors {

    // Typed error categories, mirroring how the step outcome is classified
    enum class ErrorCategory {
        Configuration,  // E.g., negative timeout, bad flag
        Run,            // The wrapped command failed or could not start
        Context,        // Canceled or deadline exceeded
        Skip,           // A predecessor step failed
        Substitution,   // A $(steps...) reference could not be resolved
        Evaluation,     // A guard expression could not be evaluated
        Collection,     // A result or artifact file could not be read
        Internal        // I/O on our own files, logic bugs
    };

    // The standardized error payload
    struct StepError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<int> exit_code;  // only set for "exit_error"
    };

    // A Result holds either a successful value of type T, OR a StepError.
    template <typename T>
    using Result = std::variant<T, StepError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<StepError>(result);
    }

    template <typename T>
    const StepError& get_error(const Result<T>& result) {
        return std::get<StepError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // --- Well-known errors shared across the coordinator ---

    inline StepError context_canceled() {
        return StepError{ErrorCategory::Context, "context canceled", "context_canceled"};
    }

    inline StepError context_deadline_exceeded() {
        return StepError{ErrorCategory::Context, "context deadline exceeded",
                         "context_deadline_exceeded"};
    }

    inline StepError skip_previous_step_failed() {
        return StepError{ErrorCategory::Skip,
                         "error file present, bail and skip the step",
                         "skip_previous_step_failed"};
    }

    inline StepError debug_before_step_failed() {
        return StepError{ErrorCategory::Run,
                         "before step breakpoint error file, user decided to skip "
                         "the current step execution",
                         "debug_before_step_failed"};
    }

    inline bool is_context_canceled(const StepError& err) {
        return err.code == "context_canceled";
    }

    inline bool is_context_deadline_exceeded(const StepError& err) {
        return err.code == "context_deadline_exceeded";
    }

    inline bool is_skip_previous_step_failed(const StepError& err) {
        return err.code == "skip_previous_step_failed";
    }

    inline bool is_exit_error(const StepError& err) {
        return err.code == "exit_error";
    }

} // namespace stepgate::core::errors
