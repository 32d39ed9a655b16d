#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/step_errors.hpp"

namespace stepgate::substitution {

// A decoded result file: a plain string, an array of strings, or an object
// with string properties.
using ResultValue = std::variant<std::string, std::vector<std::string>,
                                 std::map<std::string, std::string>>;

ResultValue decode_result_value(const std::string& content);

// $(steps.<step>.results.<name>), optionally followed by [n], [*] or .<prop>
struct ResultReference {
    std::string step_name;
    std::string result_name;
    std::optional<std::size_t> index;
    bool whole_array = false;
    std::optional<std::string> property;
};

// `expression` is the full "$(...)" token.
core::errors::Result<ResultReference> parse_result_reference(
    const std::string& expression);

// <steps_dir>/step-<step>/results/<name>
std::filesystem::path result_file_path(const std::filesystem::path& steps_dir,
                                       const ResultReference& reference);

// What a reference resolves to: a single string, or the elements of [*].
using ResolvedValue = std::variant<std::string, std::vector<std::string>>;

core::errors::Result<ResolvedValue> resolve_result_reference(
    const std::filesystem::path& steps_dir, const ResultReference& reference);

}  // namespace stepgate::substitution
