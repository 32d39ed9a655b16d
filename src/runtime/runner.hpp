#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/step_errors.hpp"
#include "runtime/cancel_context.hpp"

namespace stepgate::runtime {

class Runner {
public:
    virtual ~Runner() = default;

    // Runs args[0] with args[1..]. Errors: "exit_error" (non-zero exit, with
    // exit_code), "start_failed" (could not start), or a context error.
    virtual core::errors::Status run(
        const CancelContext& ctx, const std::vector<std::string>& args,
        const std::map<std::string, std::string>& environment) = 0;
};

struct ProcessRunnerOptions {
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
};

// fork/execvp runner. The child inherits our stdout/stderr, optionally teed
// into files.
class ProcessRunner : public Runner {
public:
    explicit ProcessRunner(ProcessRunnerOptions options = {});

    core::errors::Status run(
        const CancelContext& ctx, const std::vector<std::string>& args,
        const std::map<std::string, std::string>& environment) override;

private:
    ProcessRunnerOptions options_;
};

}  // namespace stepgate::runtime
