#include "when/when_evaluator.hpp"

#include <algorithm>
#include "core/logging/logger.hpp"
#include "when/cel_expression.hpp"

namespace stepgate::when {

using core::errors::ErrorCategory;
using core::errors::StepError;

namespace {

bool evaluate_operator(const protocol::OperatorGuard& guard) {
    const bool found =
        std::find(guard.values.begin(), guard.values.end(), guard.input) != guard.values.end();
    return guard.op == protocol::GuardOperator::In ? found : !found;
}

core::errors::Result<bool> evaluate_cel(const protocol::CelGuard& guard) {
    auto program = CelProgram::compile(guard.expression);
    if (core::errors::is_error(program)) {
        return core::errors::get_error(program);
    }
    auto value = core::errors::get_value(program).evaluate();
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }
    const auto& result = core::errors::get_value(value);
    if (!result.is_bool()) {
        return StepError{ErrorCategory::Evaluation,
                         "Expression \"" + guard.expression + "\" evaluated to " +
                             type_name(result) + ", expected bool",
                         "cel_non_boolean_result"};
    }
    return std::get<bool>(result.data);
}

}  // namespace

core::errors::Result<bool> evaluate_guard(const protocol::GuardExpression& guard) {
    if (const auto* op_guard = std::get_if<protocol::OperatorGuard>(&guard)) {
        return evaluate_operator(*op_guard);
    }
    return evaluate_cel(std::get<protocol::CelGuard>(guard));
}

core::errors::Result<bool> allow_exec(const std::vector<protocol::GuardExpression>& guards) {
    for (std::size_t i = 0; i < guards.size(); ++i) {
        auto allowed = evaluate_guard(guards[i]);
        if (core::errors::is_error(allowed)) {
            return allowed;
        }
        if (!core::errors::get_value(allowed)) {
            LOG_DEBUG("Guard " + std::to_string(i) + " evaluated to false");
            return false;
        }
    }
    return true;
}

}  // namespace stepgate::when
