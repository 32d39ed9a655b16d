#include "substitution/result_reference.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include "core/config/defaults.hpp"
#include "core/fs/file_io.hpp"

namespace stepgate::substitution {

using core::errors::ErrorCategory;
using core::errors::StepError;
using nlohmann::json;

namespace {

constexpr const char* kReferencePrefix = "$(";
constexpr const char* kReferenceSuffix = ")";

StepError invalid_reference(const std::string& expression, const std::string& why) {
    return StepError{ErrorCategory::Substitution,
                     "Invalid result reference " + expression + ": " + why,
                     "invalid_result_reference"};
}

std::vector<std::string> split(const std::string& text, const char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::optional<std::vector<std::string>> as_string_array(const std::string& content) {
    const auto parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> items;
    for (const auto& item : parsed) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::optional<std::map<std::string, std::string>> as_string_object(
    const std::string& content) {
    const auto parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    std::map<std::string, std::string> properties;
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        if (!it.value().is_string()) {
            return std::nullopt;
        }
        properties[it.key()] = it.value().get<std::string>();
    }
    return properties;
}

}  // namespace

ResultValue decode_result_value(const std::string& content) {
    if (content.empty()) {
        return std::string();
    }
    if (content.front() == '[') {
        if (auto items = as_string_array(content)) {
            return std::move(items.value());
        }
    }
    if (content.front() == '{') {
        if (auto properties = as_string_object(content)) {
            return std::move(properties.value());
        }
    }

    // Results written with `echo -n "\"x\""` arrive JSON-quoted.
    const auto parsed = json::parse(content, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_string()) {
        return parsed.get<std::string>();
    }
    return content;
}

core::errors::Result<ResultReference> parse_result_reference(
    const std::string& expression) {
    const std::string prefix = kReferencePrefix;
    const std::string suffix = kReferenceSuffix;
    if (expression.size() < prefix.size() + suffix.size() ||
        expression.compare(0, prefix.size(), prefix) != 0 ||
        expression.compare(expression.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return invalid_reference(expression, "must be wrapped in $( )");
    }

    const auto body = expression.substr(prefix.size(),
                                        expression.size() - prefix.size() - suffix.size());
    const auto parts = split(body, '.');
    if (parts.size() != 4 && parts.size() != 5) {
        return invalid_reference(expression,
                                 "expected steps.<step>.results.<name>[.<property>]");
    }
    if (parts[0] != "steps" || parts[2] != "results") {
        return invalid_reference(expression,
                                 "expected steps.<step>.results.<name>[.<property>]");
    }
    if (parts[1].empty()) {
        return invalid_reference(expression, "step name is empty");
    }

    ResultReference reference;
    reference.step_name = parts[1];

    auto name = parts[3];
    const auto bracket = name.find('[');
    if (bracket != std::string::npos) {
        if (name.back() != ']') {
            return invalid_reference(expression, "unterminated index");
        }
        const auto index_text = name.substr(bracket + 1, name.size() - bracket - 2);
        name = name.substr(0, bracket);
        if (index_text == "*") {
            reference.whole_array = true;
        } else {
            std::size_t index = 0;
            const auto* first = index_text.data();
            const auto* last = index_text.data() + index_text.size();
            const auto [ptr, ec] = std::from_chars(first, last, index);
            if (index_text.empty() || ec != std::errc() || ptr != last) {
                return invalid_reference(expression, "index must be a non-negative integer");
            }
            reference.index = index;
        }
    }
    if (name.empty()) {
        return invalid_reference(expression, "result name is empty");
    }
    reference.result_name = name;

    if (parts.size() == 5) {
        if (reference.index.has_value() || reference.whole_array) {
            return invalid_reference(expression, "cannot combine an index with a property");
        }
        if (parts[4].empty()) {
            return invalid_reference(expression, "property name is empty");
        }
        reference.property = parts[4];
    }
    return reference;
}

std::filesystem::path result_file_path(const std::filesystem::path& steps_dir,
                                       const ResultReference& reference) {
    return steps_dir / core::config::container_name(reference.step_name) /
           core::config::kResultsDirName / reference.result_name;
}

core::errors::Result<ResolvedValue> resolve_result_reference(
    const std::filesystem::path& steps_dir, const ResultReference& reference) {
    const auto path = result_file_path(steps_dir, reference);
    auto content = core::fs::read_text_file(path);
    if (core::errors::is_error(content)) {
        auto error = core::errors::get_error(content);
        error.category = ErrorCategory::Substitution;
        error.code = core::fs::is_file_not_found(error) ? "result_not_found"
                                                        : "result_read_failed";
        return error;
    }

    const auto value = decode_result_value(core::errors::get_value(content));
    const auto label = "steps." + reference.step_name + ".results." + reference.result_name;

    if (reference.property.has_value()) {
        const auto* properties = std::get_if<std::map<std::string, std::string>>(&value);
        if (properties == nullptr) {
            return StepError{ErrorCategory::Substitution,
                             label + " is not an object result", "result_type_mismatch"};
        }
        const auto it = properties->find(reference.property.value());
        if (it == properties->end()) {
            return StepError{ErrorCategory::Substitution,
                             label + " has no property " + reference.property.value(),
                             "unknown_result_property"};
        }
        return ResolvedValue(it->second);
    }

    if (reference.index.has_value() || reference.whole_array) {
        const auto* items = std::get_if<std::vector<std::string>>(&value);
        if (items == nullptr) {
            return StepError{ErrorCategory::Substitution,
                             label + " is not an array result", "result_type_mismatch"};
        }
        if (reference.whole_array) {
            return ResolvedValue(*items);
        }
        if (reference.index.value() >= items->size()) {
            return StepError{ErrorCategory::Substitution,
                             label + " index " + std::to_string(reference.index.value()) +
                                 " is out of range",
                             "result_index_out_of_range"};
        }
        return ResolvedValue(items->at(reference.index.value()));
    }

    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
        return StepError{ErrorCategory::Substitution,
                         label + " is not a string result; reference an element or property",
                         "result_type_mismatch"};
    }
    return ResolvedValue(*text);
}

}  // namespace stepgate::substitution
