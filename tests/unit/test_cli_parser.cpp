#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/step_errors.hpp"

namespace {

using stepgate::app::cli::parse_and_validate;
using stepgate::core::errors::ErrorCategory;
using stepgate::core::errors::get_error;
using stepgate::core::errors::get_value;
using stepgate::core::errors::is_error;
using stepgate::protocol::CelGuard;
using stepgate::protocol::GuardOperator;
using stepgate::protocol::OnErrorPolicy;
using stepgate::protocol::OperatorGuard;
using stepgate::protocol::StepExecutionRequest;

stepgate::core::errors::Result<StepExecutionRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("stepgate");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, DefaultsWithoutFlags) {
    auto result = parse_tokens({});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_TRUE(req.command.empty());
    EXPECT_EQ(req.cancel_file.string(), "/tekton/downward/cancel");
    EXPECT_EQ(req.steps_dir.string(), "/tekton/steps");
    EXPECT_EQ(req.results_dir.string(), "/tekton/results");
    EXPECT_EQ(req.poll_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(req.on_error, OnErrorPolicy::StopAndFail);
    EXPECT_FALSE(req.timeout.has_value());
}

TEST(CliParserTest, ParsesFullInvocation) {
    auto result = parse_tokens({"--wait-file", "/tekton/run/0/out", "--wait-file", "/tekton/run/1/out",
                                "--wait-file-content", "--post-file", "/tekton/run/2/out",
                                "--termination-path", "/tekton/termination",
                                "--results", "digest,url", "--step-results", "log",
                                "--step-metadata-dir", "/tekton/run/2/status",
                                "--timeout", "90s", "--on-error", "continue",
                                "--breakpoint-on-failure", "--verbose",
                                "--", "sh", "-c", "echo --not-a-flag"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.wait_files, (std::vector<std::string>{"/tekton/run/0/out", "/tekton/run/1/out"}));
    EXPECT_TRUE(req.wait_file_content);
    EXPECT_EQ(req.post_file, "/tekton/run/2/out");
    EXPECT_EQ(req.termination_path.string(), "/tekton/termination");
    EXPECT_EQ(req.results, (std::vector<std::string>{"digest", "url"}));
    EXPECT_EQ(req.step_results, (std::vector<std::string>{"log"}));
    EXPECT_EQ(req.step_metadata_dir.string(), "/tekton/run/2/status");
    EXPECT_EQ(req.timeout.value(), std::chrono::seconds(90));
    EXPECT_EQ(req.on_error, OnErrorPolicy::Continue);
    EXPECT_TRUE(req.breakpoint_on_failure);
    EXPECT_TRUE(req.verbose);
    EXPECT_EQ(req.command, (std::vector<std::string>{"sh", "-c", "echo --not-a-flag"}));
}

TEST(CliParserTest, NegativeTimeoutIsLeftForTheCoordinator) {
    auto result = parse_tokens({"--timeout", "-5ms"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).timeout.value(), std::chrono::milliseconds(-5));
}

TEST(CliParserTest, FailsOnMalformedTimeout) {
    for (const std::string value : {"10", "ms", "5x", "1.5s", "5-s"}) {
        auto result = parse_tokens({"--timeout", value});
        ASSERT_TRUE(is_error(result)) << value;
        EXPECT_EQ(get_error(result).code, "invalid_duration") << value;
    }
}

TEST(CliParserTest, RejectsTimeoutBeyondMillisecondRange) {
    for (const std::string value : {"2562047788016h", "-2562047788016h", "153722867280913m",
                                    "9223372036854776s"}) {
        auto result = parse_tokens({"--timeout", value});
        ASSERT_TRUE(is_error(result)) << value;
        EXPECT_EQ(get_error(result).code, "bounds_error") << value;
    }

    auto largest = parse_tokens({"--timeout", "2562047788015h"});
    ASSERT_FALSE(is_error(largest));
    EXPECT_EQ(get_value(largest).timeout.value(), std::chrono::hours(2562047788015LL));
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"--post-file"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"--entrypoint", "sh"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsOnUnknownOnErrorValue) {
    auto result = parse_tokens({"--on-error", "ignore"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_on_error");
}

TEST(CliParserTest, ParsesWhenExpressions) {
    auto result = parse_tokens(
        {"--when", R"([{"input":"main","operator":"in","values":["main","dev"]},{"cel":"1 < 2"}])"});
    ASSERT_FALSE(is_error(result));
    const auto& when = get_value(result).when;
    ASSERT_EQ(when.size(), 2u);
    const auto& op_guard = std::get<OperatorGuard>(when[0]);
    EXPECT_EQ(op_guard.input, "main");
    EXPECT_EQ(op_guard.op, GuardOperator::In);
    EXPECT_EQ(op_guard.values, (std::vector<std::string>{"main", "dev"}));
    EXPECT_EQ(std::get<CelGuard>(when[1]).expression, "1 < 2");
}

TEST(CliParserTest, FailsOnInvalidWhen) {
    for (const std::string value : {"not json", "{}", R"([{"input":"a","operator":"equals"}])",
                                    R"([{"input":"a","operator":"in","values":[1]}])"}) {
        auto result = parse_tokens({"--when", value});
        ASSERT_TRUE(is_error(result)) << value;
        EXPECT_EQ(get_error(result).code, "invalid_when") << value;
    }
}

TEST(CliParserTest, SigningFlagsComeAsAPair) {
    auto result = parse_tokens({"--signing-key", "/spire/svid_key.pem"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");

    auto both = parse_tokens({"--signing-key", "/spire/svid_key.pem", "--signing-cert", "/spire/svid.pem"});
    ASSERT_FALSE(is_error(both));
    EXPECT_EQ(get_value(both).signing_cert->string(), "/spire/svid.pem");
}

TEST(CliParserTest, FailsWhenPollIntervalNotNumeric) {
    auto result = parse_tokens({"--poll-interval-ms", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenPollIntervalOutOfBounds) {
    auto result = parse_tokens({"--poll-interval-ms", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, DebugBeforeStepNeedsPostFile) {
    auto result = parse_tokens({"--debug-before-step"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

}  // namespace
