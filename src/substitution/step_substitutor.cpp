#include "substitution/step_substitutor.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <utility>
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"
#include "substitution/artifact_template.hpp"
#include "substitution/result_reference.hpp"

namespace stepgate::substitution {

using core::errors::ErrorCategory;
using core::errors::StepError;

namespace {

const std::regex& result_reference_pattern() {
    static const std::regex pattern(R"(\$\(steps\..*?\.results\..*?\))");
    return pattern;
}

const std::regex& artifact_reference_pattern() {
    static const std::regex pattern(R"(\$\(steps\.[^.)]+\.(inputs|outputs)\.[^)]*\))");
    return pattern;
}

using Resolver = std::function<core::errors::Result<ResolvedValue>(const std::string&)>;

// Replaces every match of `pattern` in `text`. A match that resolves to a
// list is only allowed when `expand` is given and the match is all of `text`.
core::errors::Status replace_in_text(const std::string& text, const std::regex& pattern,
                                     const Resolver& resolve,
                                     std::vector<std::string>& out, const bool expand) {
    std::string rewritten;
    auto cursor = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
        const auto& match = *it;
        auto resolved = resolve(match.str());
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        const auto& value = core::errors::get_value(resolved);

        if (const auto* items = std::get_if<std::vector<std::string>>(&value)) {
            if (!expand || match.length() != static_cast<std::ptrdiff_t>(text.size())) {
                return StepError{ErrorCategory::Substitution,
                                 "Array reference " + match.str() +
                                     " must be the whole argument, found in \"" + text + "\"",
                                 "array_expansion_not_allowed"};
            }
            out.insert(out.end(), items->begin(), items->end());
            return core::errors::ok();
        }

        rewritten.append(cursor, match[0].first);
        rewritten.append(std::get<std::string>(value));
        cursor = match[0].second;
    }
    rewritten.append(cursor, text.cend());
    out.push_back(std::move(rewritten));
    return core::errors::ok();
}

core::errors::Result<std::string> replace_scalar(const std::string& text,
                                                 const std::regex& pattern,
                                                 const Resolver& resolve) {
    std::vector<std::string> out;
    auto status = replace_in_text(text, pattern, resolve, out, false);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return out.front();
}

// A command made of one existing readable file is a script; its contents are
// substituted instead of its path.
std::optional<std::filesystem::path> script_path(const std::vector<std::string>& command) {
    if (command.size() != 1 || command.front().empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    const std::filesystem::path candidate(command.front());
    if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
        return std::nullopt;
    }
    return candidate;
}

struct PendingScript {
    std::filesystem::path path;
    std::string original;
    std::string rewritten;
};

// Runs one substitution pass over a copy of the target and commits only if
// every reference resolved.
core::errors::Status run_pass(SubstitutionTarget& target, const std::regex& pattern,
                              const Resolver& resolve, const bool include_guards) {
    SubstitutionTarget staged = target;
    std::optional<PendingScript> script;

    if (auto path = script_path(staged.command)) {
        auto content = core::fs::read_text_file(path.value());
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        auto rewritten = replace_scalar(core::errors::get_value(content), pattern, resolve);
        if (core::errors::is_error(rewritten)) {
            return core::errors::get_error(rewritten);
        }
        script = PendingScript{path.value(), core::errors::get_value(content),
                               core::errors::get_value(rewritten)};
    } else {
        std::vector<std::string> command;
        for (const auto& token : staged.command) {
            auto status = replace_in_text(token, pattern, resolve, command, true);
            if (core::errors::is_error(status)) {
                return status;
            }
        }
        staged.command = std::move(command);
    }

    for (auto& [name, value] : staged.environment) {
        auto rewritten = replace_scalar(value, pattern, resolve);
        if (core::errors::is_error(rewritten)) {
            auto error = core::errors::get_error(rewritten);
            error.hint = "while substituting environment variable " + name;
            return error;
        }
        value = core::errors::get_value(rewritten);
    }

    if (include_guards) {
        for (auto& guard : staged.when) {
            if (auto* op_guard = std::get_if<protocol::OperatorGuard>(&guard)) {
                auto input = replace_scalar(op_guard->input, pattern, resolve);
                if (core::errors::is_error(input)) {
                    return core::errors::get_error(input);
                }
                op_guard->input = core::errors::get_value(input);

                std::vector<std::string> values;
                for (const auto& value : op_guard->values) {
                    auto status = replace_in_text(value, pattern, resolve, values, true);
                    if (core::errors::is_error(status)) {
                        return status;
                    }
                }
                op_guard->values = std::move(values);
            } else {
                auto& cel_guard = std::get<protocol::CelGuard>(guard);
                auto expression = replace_scalar(cel_guard.expression, pattern, resolve);
                if (core::errors::is_error(expression)) {
                    return core::errors::get_error(expression);
                }
                cel_guard.expression = core::errors::get_value(expression);
            }
        }
    }

    if (script.has_value() && script->rewritten != script->original) {
        auto written = core::fs::write_file_atomic(script->path, script->rewritten);
        if (core::errors::is_error(written)) {
            return written;
        }
        LOG_DEBUG("Substituted references in script " + script->path.string());
    }

    target = std::move(staged);
    return core::errors::ok();
}

}  // namespace

StepSubstitutor::StepSubstitutor(std::filesystem::path steps_dir)
    : steps_dir_(std::move(steps_dir)) {}

core::errors::Status StepSubstitutor::apply_result_substitutions(
    SubstitutionTarget& target) const {
    const Resolver resolve =
        [this](const std::string& expression) -> core::errors::Result<ResolvedValue> {
        auto reference = parse_result_reference(expression);
        if (core::errors::is_error(reference)) {
            return core::errors::get_error(reference);
        }
        return resolve_result_reference(steps_dir_, core::errors::get_value(reference));
    };

    auto status = run_pass(target, result_reference_pattern(), resolve, true);
    if (core::errors::is_error(status)) {
        LOG_ERROR("Result substitution failed: " + core::errors::get_error(status).message);
    }
    return status;
}

core::errors::Status StepSubstitutor::apply_artifact_substitutions(
    SubstitutionTarget& target) const {
    const Resolver resolve =
        [this](const std::string& expression) -> core::errors::Result<ResolvedValue> {
        auto values = artifact_values(steps_dir_, expression);
        if (core::errors::is_error(values)) {
            return core::errors::get_error(values);
        }
        return ResolvedValue(core::errors::get_value(values));
    };

    auto status = run_pass(target, artifact_reference_pattern(), resolve, false);
    if (core::errors::is_error(status)) {
        LOG_ERROR("Artifact substitution failed: " + core::errors::get_error(status).message);
    }
    return status;
}

}  // namespace stepgate::substitution
