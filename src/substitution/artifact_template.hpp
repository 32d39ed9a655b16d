#pragma once

#include <filesystem>
#include <string>
#include "core/errors/step_errors.hpp"
#include "protocol/artifacts.hpp"

namespace stepgate::substitution {

// Parses "$(steps.<step>.inputs|outputs.<artifact>)". The whole string must be
// exactly one template.
core::errors::Result<protocol::ArtifactTemplate> parse_artifact_template(
    const std::string& text);

// <dir>/<container>/artifacts/provenance.json
std::filesystem::path step_artifacts_path(const std::filesystem::path& dir,
                                          const std::string& container_name);

core::errors::Result<protocol::Artifacts> parse_artifacts(const std::string& content);

// Unlike result collection, a missing manifest is an error here: something
// referenced it.
core::errors::Result<protocol::Artifacts> load_step_artifacts(
    const std::filesystem::path& steps_dir, const std::string& container_name);

// Compact JSON of the referenced artifact's values, e.g.
// [{"digest":{"sha256":"..."},"uri":"..."}]
core::errors::Result<std::string> artifact_values(const std::filesystem::path& steps_dir,
                                                  const std::string& text);

}  // namespace stepgate::substitution
