#include <map>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "coordinator/coordinator.hpp"
#include "core/errors/step_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/post_writer.hpp"
#include "runtime/runner.hpp"
#include "runtime/waiter.hpp"
#include "signing/key_file_signer.hpp"

extern char** environ;

namespace {

// Exit status reported for a step stopped by cancellation (128 + SIGKILL).
constexpr int kCanceledExitStatus = 137;

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> environment;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string pair(*entry);
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        environment.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    return environment;
}

int exit_status_for(const stepgate::core::errors::StepError& err) {
    if (stepgate::core::errors::is_exit_error(err) && err.exit_code.has_value() &&
        err.exit_code.value() > 0) {
        return err.exit_code.value();
    }
    if (stepgate::core::errors::is_context_canceled(err)) {
        return kCanceledExitStatus;
    }
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized configuration errors
    auto parsed = stepgate::app::cli::parse_and_validate(argc, argv);
    if (stepgate::core::errors::is_error(parsed)) {
        const auto& err = stepgate::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    auto req = stepgate::core::errors::get_value(parsed);
    if (req.verbose) {
        stepgate::core::logging::Logger::get().set_min_level(
            stepgate::core::logging::LogLevel::DEBUG);
    }
    if (!req.step_metadata_dir.empty()) {
        stepgate::core::logging::Logger::get().set_step(
            req.step_metadata_dir.filename().string());
    }

    // 2. The child sees our environment, with nothing the request already set
    for (auto& [name, value] : current_environment()) {
        req.environment.emplace(name, value);
    }

    // 3. Wire the collaborators
    stepgate::coordinator::Collaborators collaborators;
    collaborators.waiter = std::make_shared<stepgate::runtime::FileWaiter>(req.poll_interval);
    collaborators.runner = std::make_shared<stepgate::runtime::ProcessRunner>(
        stepgate::runtime::ProcessRunnerOptions{req.stdout_path, req.stderr_path});
    collaborators.post_writer = std::make_shared<stepgate::runtime::FilePostWriter>();

    if (req.signing_key.has_value() && req.signing_cert.has_value()) {
        auto signer = stepgate::signing::KeyFileSigner::load(req.signing_key.value(),
                                                              req.signing_cert.value());
        if (stepgate::core::errors::is_error(signer)) {
            const auto& err = stepgate::core::errors::get_error(signer);
            LOG_ERROR("Failed to load signing material [" + err.code + "]: " + err.message);
            return 1;
        }
        collaborators.signer = stepgate::core::errors::get_value(signer);
    }

    // 4. Run the step
    LOG_DEBUG("Starting step coordinator");
    stepgate::coordinator::Coordinator coordinator(std::move(req), std::move(collaborators));
    auto outcome = coordinator.run();
    if (stepgate::core::errors::is_error(outcome)) {
        const auto& err = stepgate::core::errors::get_error(outcome);
        LOG_ERROR("Step failed [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return exit_status_for(err);
    }

    const auto& result = stepgate::core::errors::get_value(outcome);
    LOG_INFO("Final step state: " + stepgate::coordinator::to_string(result.state));
    return 0;
}
