#include <map>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "substitution/result_reference.hpp"
#include "substitution/step_substitutor.hpp"
#include "test_support.hpp"

namespace {

using stepgate::core::errors::get_error;
using stepgate::core::errors::get_value;
using stepgate::core::errors::is_error;
using stepgate::protocol::CelGuard;
using stepgate::protocol::GuardOperator;
using stepgate::protocol::OperatorGuard;
using stepgate::substitution::decode_result_value;
using stepgate::substitution::parse_result_reference;
using stepgate::substitution::result_file_path;
using stepgate::substitution::StepSubstitutor;
using stepgate::substitution::SubstitutionTarget;
using stepgate::testing::read_file;
using stepgate::testing::TempWorkspace;
using stepgate::testing::write_file;

void write_result(const std::filesystem::path& steps_dir, const std::string& step,
                  const std::string& name, const std::string& content) {
    write_file(steps_dir / ("step-" + step) / "results" / name, content);
}

TEST(ResultReferenceTest, ParsesPlainReference) {
    auto parsed = parse_result_reference("$(steps.build.results.digest)");
    ASSERT_FALSE(is_error(parsed));
    const auto& ref = get_value(parsed);
    EXPECT_EQ(ref.step_name, "build");
    EXPECT_EQ(ref.result_name, "digest");
    EXPECT_FALSE(ref.index.has_value());
    EXPECT_FALSE(ref.whole_array);
    EXPECT_FALSE(ref.property.has_value());
    EXPECT_EQ(result_file_path("/tekton/steps", ref).string(),
              "/tekton/steps/step-build/results/digest");
}

TEST(ResultReferenceTest, ParsesIndexStarAndProperty) {
    auto indexed = parse_result_reference("$(steps.a.results.list[2])");
    ASSERT_FALSE(is_error(indexed));
    EXPECT_EQ(get_value(indexed).index.value(), 2u);
    EXPECT_EQ(get_value(indexed).result_name, "list");

    auto star = parse_result_reference("$(steps.a.results.list[*])");
    ASSERT_FALSE(is_error(star));
    EXPECT_TRUE(get_value(star).whole_array);

    auto property = parse_result_reference("$(steps.a.results.obj.url)");
    ASSERT_FALSE(is_error(property));
    EXPECT_EQ(get_value(property).property.value(), "url");
}

TEST(ResultReferenceTest, RejectsMalformedReferences) {
    for (const std::string text : {"$(steps.a.outputs.b)", "$(steps.a.results)",
                                   "$(tasks.a.results.b)", "$(steps.a.results.b[x])",
                                   "$(steps.a.results.b[0].c)", "steps.a.results.b"}) {
        auto parsed = parse_result_reference(text);
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).code, "invalid_result_reference") << text;
    }
}

TEST(ResultReferenceTest, DecodesStoredValues) {
    EXPECT_EQ(std::get<std::string>(decode_result_value("")), "");
    EXPECT_EQ(std::get<std::string>(decode_result_value("plain text")), "plain text");
    EXPECT_EQ(std::get<std::string>(decode_result_value("\"quoted\"")), "quoted");
    EXPECT_EQ(std::get<std::vector<std::string>>(decode_result_value("[\"a\",\"b\"]")),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ((std::get<std::map<std::string, std::string>>(
                  decode_result_value("{\"k\":\"v\"}"))),
              (std::map<std::string, std::string>{{"k", "v"}}));
    // Not an array of strings, so it stays a raw string
    EXPECT_EQ(std::get<std::string>(decode_result_value("[1,2]")), "[1,2]");
}

TEST(StepSubstitutorTest, ReplacesScalarsInCommandAndEnvironment) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "build", "digest", "sha256:abc");

    SubstitutionTarget target;
    target.command = {"echo", "image@$(steps.build.results.digest)"};
    target.environment = {{"DIGEST", "$(steps.build.results.digest)"}, {"OTHER", "plain"}};

    StepSubstitutor substitutor(workspace.root());
    ASSERT_FALSE(is_error(substitutor.apply_result_substitutions(target)));
    EXPECT_EQ(target.command, (std::vector<std::string>{"echo", "image@sha256:abc"}));
    EXPECT_EQ(target.environment.at("DIGEST"), "sha256:abc");
    EXPECT_EQ(target.environment.at("OTHER"), "plain");
}

TEST(StepSubstitutorTest, ExpandsWholeArrayIntoArguments) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "list", "files", "[\"a.txt\",\"b.txt\"]");

    SubstitutionTarget target;
    target.command = {"cat", "$(steps.list.results.files[*])", "$(steps.list.results.files[1])"};

    StepSubstitutor substitutor(workspace.root());
    ASSERT_FALSE(is_error(substitutor.apply_result_substitutions(target)));
    EXPECT_EQ(target.command, (std::vector<std::string>{"cat", "a.txt", "b.txt", "b.txt"}));
}

TEST(StepSubstitutorTest, ArrayInsideLargerArgumentIsRejected) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "list", "files", "[\"a\",\"b\"]");

    SubstitutionTarget target;
    target.command = {"echo", "files=$(steps.list.results.files[*])"};

    StepSubstitutor substitutor(workspace.root());
    auto status = substitutor.apply_result_substitutions(target);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "array_expansion_not_allowed");
}

TEST(StepSubstitutorTest, ResolvesObjectProperty) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "meta", "image", "{\"url\":\"registry/app\",\"tag\":\"v1\"}");

    SubstitutionTarget target;
    target.command = {"deploy", "$(steps.meta.results.image.url):$(steps.meta.results.image.tag)"};

    StepSubstitutor substitutor(workspace.root());
    ASSERT_FALSE(is_error(substitutor.apply_result_substitutions(target)));
    EXPECT_EQ(target.command.at(1), "registry/app:v1");
}

TEST(StepSubstitutorTest, FailureLeavesTargetUntouched) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "build", "digest", "sha256:abc");

    SubstitutionTarget target;
    target.command = {"echo", "$(steps.build.results.digest)"};
    target.environment = {{"MISSING", "$(steps.build.results.nope)"}};

    StepSubstitutor substitutor(workspace.root());
    auto status = substitutor.apply_result_substitutions(target);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "result_not_found");
    EXPECT_EQ(get_error(status).hint, "while substituting environment variable MISSING");
    EXPECT_EQ(target.command.at(1), "$(steps.build.results.digest)");
}

TEST(StepSubstitutorTest, IndexOutOfRangeFails) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "list", "files", "[\"a\"]");

    SubstitutionTarget target;
    target.command = {"echo", "$(steps.list.results.files[3])"};

    StepSubstitutor substitutor(workspace.root());
    auto status = substitutor.apply_result_substitutions(target);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "result_index_out_of_range");
}

TEST(StepSubstitutorTest, RewritesScriptInPlace) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "build", "digest", "sha256:abc");
    const auto script = workspace.root() / "scripts" / "script-0";
    write_file(script, "#!/bin/sh\necho $(steps.build.results.digest)\n");

    SubstitutionTarget target;
    target.command = {script.string()};

    StepSubstitutor substitutor(workspace.root());
    ASSERT_FALSE(is_error(substitutor.apply_result_substitutions(target)));
    EXPECT_EQ(target.command, (std::vector<std::string>{script.string()}));
    EXPECT_EQ(read_file(script), "#!/bin/sh\necho sha256:abc\n");
}

TEST(StepSubstitutorTest, SubstitutesGuards) {
    TempWorkspace workspace("results");
    write_result(workspace.root(), "check", "status", "passed");
    write_result(workspace.root(), "check", "allowed", "[\"passed\",\"skipped\"]");

    SubstitutionTarget target;
    target.when.emplace_back(OperatorGuard{"$(steps.check.results.status)", GuardOperator::In,
                                           {"$(steps.check.results.allowed[*])"}});
    target.when.emplace_back(CelGuard{"'$(steps.check.results.status)' == 'passed'"});

    StepSubstitutor substitutor(workspace.root());
    ASSERT_FALSE(is_error(substitutor.apply_result_substitutions(target)));
    const auto& op_guard = std::get<OperatorGuard>(target.when.at(0));
    EXPECT_EQ(op_guard.input, "passed");
    EXPECT_EQ(op_guard.values, (std::vector<std::string>{"passed", "skipped"}));
    EXPECT_EQ(std::get<CelGuard>(target.when.at(1)).expression, "'passed' == 'passed'");
}

}  // namespace
