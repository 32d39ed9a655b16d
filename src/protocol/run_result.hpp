#pragma once

#include <string>

namespace stepgate::protocol {

// Numeric codes are part of the termination record wire format.
enum class ResultType {
    TaskRunResult = 1,
    Internal = 3,
    StepResult = 4,
    StepArtifacts = 5,
    TaskRunArtifacts = 6
};

struct RunResult {
    std::string key;
    std::string value;
    ResultType result_type = ResultType::TaskRunResult;
};

inline bool operator==(const RunResult& lhs, const RunResult& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value &&
           lhs.result_type == rhs.result_type;
}

inline std::string to_string(const ResultType type) {
    switch (type) {
        case ResultType::TaskRunResult:
            return "task_run_result";
        case ResultType::Internal:
            return "internal";
        case ResultType::StepResult:
            return "step_result";
        case ResultType::StepArtifacts:
            return "step_artifacts";
        case ResultType::TaskRunArtifacts:
            return "task_run_artifacts";
        default:
            return "unknown";
    }
}

// Keys of the Internal entries the coordinator emits
inline const std::string kStartedAtKey = "StartedAt";
inline const std::string kReasonKey = "Reason";
inline const std::string kExitCodeKey = "ExitCode";

// Values of the Reason entry
inline const std::string kReasonSkipped = "Skipped";
inline const std::string kReasonTimeoutExceeded = "TimeoutExceeded";
inline const std::string kReasonCancelled = "Cancelled";

}  // namespace stepgate::protocol
