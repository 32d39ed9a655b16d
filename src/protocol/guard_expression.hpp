#pragma once
#include <string>
#include <variant>
#include <vector>

namespace stepgate::protocol {

    enum class GuardOperator {
        In,
        NotIn
    };

    // {input, operator, values}: input compared against a set of values
    struct OperatorGuard {
        std::string input;
        GuardOperator op = GuardOperator::In;
        std::vector<std::string> values;
    };

    // A boolean expression in the embedded expression language
    struct CelGuard {
        std::string expression;
    };

    // A guard is exactly ONE of the kinds above; evaluation dispatches on it.
    using GuardExpression = std::variant<OperatorGuard, CelGuard>;

    inline bool operator==(const OperatorGuard& lhs, const OperatorGuard& rhs) {
        return lhs.input == rhs.input && lhs.op == rhs.op && lhs.values == rhs.values;
    }

    inline bool operator==(const CelGuard& lhs, const CelGuard& rhs) {
        return lhs.expression == rhs.expression;
    }

    inline std::string to_string(const GuardOperator op) {
        switch (op) {
            case GuardOperator::In:
                return "in";
            case GuardOperator::NotIn:
                return "notin";
            default:
                return "unknown";
        }
    }

} // namespace stepgate::protocol
