#pragma once
#include "protocol/step_request.hpp"
#include "core/errors/step_errors.hpp"

namespace stepgate::app::cli {
    // stepgate [flags] -- <command> [args...]
    stepgate::core::errors::Result<stepgate::protocol::StepExecutionRequest> parse_and_validate(int argc, char* argv[]);
}
