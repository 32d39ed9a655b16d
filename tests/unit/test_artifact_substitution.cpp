#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "substitution/artifact_template.hpp"
#include "substitution/step_substitutor.hpp"
#include "test_support.hpp"

namespace {

using stepgate::core::errors::get_error;
using stepgate::core::errors::get_value;
using stepgate::core::errors::is_error;
using stepgate::protocol::ArtifactDirection;
using stepgate::substitution::artifact_values;
using stepgate::substitution::parse_artifact_template;
using stepgate::substitution::parse_artifacts;
using stepgate::substitution::step_artifacts_path;
using stepgate::substitution::StepSubstitutor;
using stepgate::substitution::SubstitutionTarget;
using stepgate::testing::TempWorkspace;
using stepgate::testing::write_file;

const std::string kManifest = R"({
  "inputs": [{"name": "source", "values": [{"uri": "git:repo", "digest": {"sha1": "f00"}}]}],
  "outputs": [{"name": "image", "values": [{"uri": "oci:app", "digest": {"sha256": "abc"}}]}]
})";

TEST(ArtifactTemplateTest, ParsesTemplate) {
    auto parsed = parse_artifact_template("$(steps.build.outputs.image)");
    ASSERT_FALSE(is_error(parsed));
    const auto& tpl = get_value(parsed);
    EXPECT_EQ(tpl.container_name, "step-build");
    EXPECT_EQ(tpl.direction, ArtifactDirection::Outputs);
    EXPECT_EQ(tpl.artifact_name, "image");
}

TEST(ArtifactTemplateTest, RejectsMalformedTemplates) {
    for (const std::string text : {"$(steps.build.results.image)", "$(steps.build.outputs)",
                                   "steps.build.outputs.image", "$(steps..outputs.image)",
                                   "$(steps.a.outputs.b) $(steps.c.outputs.d)"}) {
        auto parsed = parse_artifact_template(text);
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).code, "invalid_artifact_template") << text;
    }
}

TEST(ArtifactTemplateTest, ParsesManifest) {
    auto parsed = parse_artifacts(kManifest);
    ASSERT_FALSE(is_error(parsed));
    const auto& artifacts = get_value(parsed);
    ASSERT_EQ(artifacts.inputs.size(), 1u);
    ASSERT_EQ(artifacts.outputs.size(), 1u);
    EXPECT_EQ(artifacts.outputs.front().values.front().uri, "oci:app");
    EXPECT_EQ(artifacts.inputs.front().values.front().digest.at("sha1"), "f00");
}

TEST(ArtifactTemplateTest, MalformedManifestFails) {
    auto parsed = parse_artifacts("{\"outputs\": 3}");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "malformed_artifact_manifest");

    auto not_json = parse_artifacts("not json");
    ASSERT_TRUE(is_error(not_json));
    EXPECT_EQ(get_error(not_json).code, "malformed_artifact_manifest");
}

TEST(ArtifactTemplateTest, ResolvesValuesAsCompactJson) {
    TempWorkspace workspace("artifacts");
    write_file(step_artifacts_path(workspace.root(), "step-build"), kManifest);

    auto values = artifact_values(workspace.root(), "$(steps.build.outputs.image)");
    ASSERT_FALSE(is_error(values));
    EXPECT_EQ(get_value(values), R"([{"digest":{"sha256":"abc"},"uri":"oci:app"}])");
}

TEST(ArtifactTemplateTest, UnknownArtifactAndMissingManifestFail) {
    TempWorkspace workspace("artifacts");
    auto missing = artifact_values(workspace.root(), "$(steps.build.outputs.image)");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "artifact_manifest_not_found");

    write_file(step_artifacts_path(workspace.root(), "step-build"), kManifest);
    auto unknown = artifact_values(workspace.root(), "$(steps.build.inputs.image)");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_artifact");
}

TEST(StepSubstitutorTest, ReplacesArtifactReferences) {
    TempWorkspace workspace("artifacts");
    write_file(step_artifacts_path(workspace.root(), "step-build"), kManifest);

    SubstitutionTarget target;
    target.command = {"sign", "--source=$(steps.build.inputs.source)"};
    target.environment = {{"IMAGE", "$(steps.build.outputs.image)"}};

    StepSubstitutor substitutor(workspace.root());
    ASSERT_FALSE(is_error(substitutor.apply_artifact_substitutions(target)));
    EXPECT_EQ(target.command.at(1), R"(--source=[{"digest":{"sha1":"f00"},"uri":"git:repo"}])");
    EXPECT_EQ(target.environment.at("IMAGE"), R"([{"digest":{"sha256":"abc"},"uri":"oci:app"}])");
}

TEST(StepSubstitutorTest, ArtifactFailureLeavesTargetUntouched) {
    TempWorkspace workspace("artifacts");
    write_file(step_artifacts_path(workspace.root(), "step-build"), kManifest);

    SubstitutionTarget target;
    target.command = {"sign", "$(steps.build.outputs.image)"};
    target.environment = {{"MISSING", "$(steps.build.outputs.nothing)"}};

    StepSubstitutor substitutor(workspace.root());
    auto status = substitutor.apply_artifact_substitutions(target);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "unknown_artifact");
    EXPECT_EQ(target.command.at(1), "$(steps.build.outputs.image)");
}

}  // namespace
