#pragma once

#include <vector>
#include "core/errors/step_errors.hpp"
#include "protocol/guard_expression.hpp"

namespace stepgate::when {

// True iff every guard holds. An empty list allows execution. Expressions are
// compiled on every call.
core::errors::Result<bool> allow_exec(const std::vector<protocol::GuardExpression>& guards);

core::errors::Result<bool> evaluate_guard(const protocol::GuardExpression& guard);

}  // namespace stepgate::when
