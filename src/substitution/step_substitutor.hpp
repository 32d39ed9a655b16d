#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/step_errors.hpp"
#include "protocol/guard_expression.hpp"

namespace stepgate::substitution {

// The parts of a step that references may appear in.
struct SubstitutionTarget {
    std::vector<std::string> command;
    std::map<std::string, std::string> environment;
    std::vector<protocol::GuardExpression> when;
};

// Resolves $(steps...) references against sibling steps' files under
// steps_dir. Each pass is all-or-nothing: on error the target and any
// referenced script are left exactly as they were.
class StepSubstitutor {
public:
    explicit StepSubstitutor(std::filesystem::path steps_dir);

    // $(steps.<s>.results.<k>[...]) in the command, environment and guards.
    core::errors::Status apply_result_substitutions(SubstitutionTarget& target) const;

    // $(steps.<s>.inputs|outputs.<name>) in the command and environment.
    core::errors::Status apply_artifact_substitutions(SubstitutionTarget& target) const;

private:
    std::filesystem::path steps_dir_;
};

}  // namespace stepgate::substitution
