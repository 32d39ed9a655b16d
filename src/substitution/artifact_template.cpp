#include "substitution/artifact_template.hpp"

#include <nlohmann/json.hpp>
#include "core/config/defaults.hpp"
#include "core/fs/file_io.hpp"

namespace stepgate::substitution {

using core::errors::ErrorCategory;
using core::errors::StepError;
using nlohmann::json;

namespace {

StepError invalid_template(const std::string& text, const std::string& why) {
    return StepError{ErrorCategory::Substitution,
                     "Invalid artifact template " + text + ": " + why,
                     "invalid_artifact_template"};
}

StepError malformed_manifest(const std::string& why) {
    return StepError{ErrorCategory::Substitution, "Malformed artifact manifest: " + why,
                     "malformed_artifact_manifest"};
}

core::errors::Result<std::vector<protocol::Artifact>> artifacts_from_json(
    const json& payload, const char* field) {
    std::vector<protocol::Artifact> artifacts;
    if (!payload.contains(field) || payload.at(field).is_null()) {
        return artifacts;
    }
    const auto& list = payload.at(field);
    if (!list.is_array()) {
        return malformed_manifest(std::string(field) + " must be an array");
    }

    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("name") || !item.at("name").is_string()) {
            return malformed_manifest(std::string(field) + " entry needs a string name");
        }
        protocol::Artifact artifact;
        artifact.name = item.at("name").get<std::string>();

        if (item.contains("values") && !item.at("values").is_null()) {
            if (!item.at("values").is_array()) {
                return malformed_manifest("values of " + artifact.name + " must be an array");
            }
            for (const auto& raw_value : item.at("values")) {
                if (!raw_value.is_object()) {
                    return malformed_manifest("value of " + artifact.name +
                                              " must be an object");
                }
                protocol::ArtifactValue value;
                if (raw_value.contains("uri")) {
                    if (!raw_value.at("uri").is_string()) {
                        return malformed_manifest("uri of " + artifact.name +
                                                  " must be a string");
                    }
                    value.uri = raw_value.at("uri").get<std::string>();
                }
                if (raw_value.contains("digest") && !raw_value.at("digest").is_null()) {
                    const auto& digest = raw_value.at("digest");
                    if (!digest.is_object()) {
                        return malformed_manifest("digest of " + artifact.name +
                                                  " must be an object");
                    }
                    for (auto it = digest.begin(); it != digest.end(); ++it) {
                        if (!it.value().is_string()) {
                            return malformed_manifest("digest of " + artifact.name +
                                                      " must map to strings");
                        }
                        value.digest[it.key()] = it.value().get<std::string>();
                    }
                }
                artifact.values.push_back(std::move(value));
            }
        }
        artifacts.push_back(std::move(artifact));
    }
    return artifacts;
}

json values_to_json(const std::vector<protocol::ArtifactValue>& values) {
    json payload = json::array();
    for (const auto& value : values) {
        json entry;
        entry["digest"] = value.digest;
        entry["uri"] = value.uri;
        payload.push_back(std::move(entry));
    }
    return payload;
}

}  // namespace

core::errors::Result<protocol::ArtifactTemplate> parse_artifact_template(
    const std::string& text) {
    if (text.size() < 3 || text.rfind("$(", 0) != 0 || text.back() != ')') {
        return invalid_template(text, "must be wrapped in $( )");
    }
    const auto body = text.substr(2, text.size() - 3);
    if (body.find("$(") != std::string::npos || body.find(')') != std::string::npos) {
        return invalid_template(text, "must contain exactly one template");
    }

    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = body.find('.', start);
        parts.push_back(body.substr(start, pos == std::string::npos ? pos : pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    if (parts.size() != 4) {
        return invalid_template(text, "expected steps.<step>.inputs|outputs.<artifact>");
    }
    if (parts[0] != "steps" || parts[1].empty() || parts[3].empty()) {
        return invalid_template(text, "expected steps.<step>.inputs|outputs.<artifact>");
    }

    protocol::ArtifactTemplate parsed;
    if (parts[2] == "inputs") {
        parsed.direction = protocol::ArtifactDirection::Inputs;
    } else if (parts[2] == "outputs") {
        parsed.direction = protocol::ArtifactDirection::Outputs;
    } else {
        return invalid_template(text, "direction must be inputs or outputs");
    }
    parsed.container_name = core::config::container_name(parts[1]);
    parsed.artifact_name = parts[3];
    return parsed;
}

std::filesystem::path step_artifacts_path(const std::filesystem::path& dir,
                                          const std::string& container_name) {
    return dir / container_name / core::config::kArtifactsDirName /
           core::config::kArtifactManifestName;
}

core::errors::Result<protocol::Artifacts> parse_artifacts(const std::string& content) {
    json payload;
    try {
        payload = json::parse(content);
    } catch (const json::parse_error& e) {
        return malformed_manifest(e.what());
    }
    if (!payload.is_object()) {
        return malformed_manifest("top level must be an object");
    }

    protocol::Artifacts artifacts;
    auto inputs = artifacts_from_json(payload, "inputs");
    if (core::errors::is_error(inputs)) {
        return core::errors::get_error(inputs);
    }
    auto outputs = artifacts_from_json(payload, "outputs");
    if (core::errors::is_error(outputs)) {
        return core::errors::get_error(outputs);
    }
    artifacts.inputs = core::errors::get_value(inputs);
    artifacts.outputs = core::errors::get_value(outputs);
    return artifacts;
}

core::errors::Result<protocol::Artifacts> load_step_artifacts(
    const std::filesystem::path& steps_dir, const std::string& container_name) {
    const auto path = step_artifacts_path(steps_dir, container_name);
    auto content = core::fs::read_text_file(path);
    if (core::errors::is_error(content)) {
        auto error = core::errors::get_error(content);
        error.category = ErrorCategory::Substitution;
        error.code = core::fs::is_file_not_found(error) ? "artifact_manifest_not_found"
                                                        : "artifact_manifest_read_failed";
        return error;
    }
    return parse_artifacts(core::errors::get_value(content));
}

core::errors::Result<std::string> artifact_values(const std::filesystem::path& steps_dir,
                                                  const std::string& text) {
    auto parsed = parse_artifact_template(text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& artifact_template = core::errors::get_value(parsed);

    auto loaded = load_step_artifacts(steps_dir, artifact_template.container_name);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const auto& artifacts = core::errors::get_value(loaded);
    const auto& candidates = artifact_template.direction == protocol::ArtifactDirection::Inputs
                                 ? artifacts.inputs
                                 : artifacts.outputs;

    for (const auto& artifact : candidates) {
        if (artifact.name == artifact_template.artifact_name) {
            return values_to_json(artifact.values).dump();
        }
    }
    return StepError{ErrorCategory::Substitution,
                     "Artifact " + artifact_template.artifact_name + " not found in " +
                         artifact_template.container_name,
                     "unknown_artifact"};
}

}  // namespace stepgate::substitution
