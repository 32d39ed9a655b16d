#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/config/defaults.hpp"
#include "protocol/guard_expression.hpp"

namespace stepgate::protocol {

    enum class OnErrorPolicy {
        StopAndFail,  // a failing command fails the step
        Continue      // a non-zero exit is recorded and the step succeeds
    };

    // Immutable per-run configuration of one step. The coordinator works on a
    // copy so substitution never leaks back into the caller's request.
    struct StepExecutionRequest {
        std::vector<std::string> command;
        std::map<std::string, std::string> environment;

        std::vector<std::string> wait_files;
        bool wait_file_content = false;
        std::string post_file;

        // Unset or zero means no deadline; negative is rejected.
        std::optional<std::chrono::milliseconds> timeout;
        OnErrorPolicy on_error = OnErrorPolicy::StopAndFail;
        bool breakpoint_on_failure = false;
        bool debug_before_step = false;

        std::vector<std::string> results;       // task-level result names
        std::vector<std::string> step_results;  // step-level result names
        std::filesystem::path results_dir = core::config::kDefaultResultsDir;
        std::filesystem::path step_metadata_dir;  // holds artifacts/ and results/
        std::filesystem::path steps_dir = core::config::kDefaultStepsDir;
        std::filesystem::path termination_path;
        std::filesystem::path cancel_file = core::config::kDefaultCancelFile;

        std::vector<GuardExpression> when;

        std::optional<std::filesystem::path> stdout_path;
        std::optional<std::filesystem::path> stderr_path;
        std::optional<std::filesystem::path> signing_key;
        std::optional<std::filesystem::path> signing_cert;
        std::chrono::milliseconds poll_interval = core::config::kDefaultPollInterval;
        bool verbose = false;
    };

    inline std::string to_string(const OnErrorPolicy policy) {
        switch (policy) {
            case OnErrorPolicy::StopAndFail:
                return "stopAndFail";
            case OnErrorPolicy::Continue:
                return "continue";
            default:
                return "unknown";
        }
    }

} // namespace stepgate::protocol
