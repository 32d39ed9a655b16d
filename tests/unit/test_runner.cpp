#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/runner.hpp"
#include "test_support.hpp"

namespace {

using stepgate::core::errors::get_error;
using stepgate::core::errors::is_context_canceled;
using stepgate::core::errors::is_context_deadline_exceeded;
using stepgate::core::errors::is_error;
using stepgate::core::errors::is_exit_error;
using stepgate::runtime::CancelContext;
using stepgate::runtime::ProcessRunner;
using stepgate::runtime::ProcessRunnerOptions;
using stepgate::testing::read_file;
using stepgate::testing::TempWorkspace;

const std::map<std::string, std::string> kNoEnvironment;

TEST(ProcessRunnerTest, EmptyCommandSucceeds) {
    ProcessRunner runner;
    auto status = runner.run(*CancelContext::background(), {}, kNoEnvironment);
    EXPECT_FALSE(is_error(status));
}

TEST(ProcessRunnerTest, ZeroExitSucceeds) {
    ProcessRunner runner;
    auto status = runner.run(*CancelContext::background(), {"/bin/sh", "-c", "exit 0"},
                             kNoEnvironment);
    EXPECT_FALSE(is_error(status));
}

TEST(ProcessRunnerTest, NonZeroExitIsExitError) {
    ProcessRunner runner;
    auto status = runner.run(*CancelContext::background(), {"/bin/sh", "-c", "exit 3"},
                             kNoEnvironment);
    ASSERT_TRUE(is_error(status));
    const auto& err = get_error(status);
    EXPECT_TRUE(is_exit_error(err));
    ASSERT_TRUE(err.exit_code.has_value());
    EXPECT_EQ(err.exit_code.value(), 3);
    EXPECT_EQ(err.message, "exit status 3");
}

TEST(ProcessRunnerTest, SignalledChildReportsMinusOne) {
    ProcessRunner runner;
    auto status = runner.run(*CancelContext::background(), {"/bin/sh", "-c", "kill -TERM $$"},
                             kNoEnvironment);
    ASSERT_TRUE(is_error(status));
    ASSERT_TRUE(get_error(status).exit_code.has_value());
    EXPECT_EQ(get_error(status).exit_code.value(), -1);
}

TEST(ProcessRunnerTest, MissingBinaryIsStartFailure) {
    ProcessRunner runner;
    auto status = runner.run(*CancelContext::background(),
                             {"/definitely/not/a/binary/stepgate"}, kNoEnvironment);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "start_failed");
    EXPECT_FALSE(get_error(status).exit_code.has_value());
}

TEST(ProcessRunnerTest, PassesEnvironmentAndTeesOutput) {
    TempWorkspace workspace("runner");
    const auto out_path = workspace.root() / "logs" / "stdout";
    const auto err_path = workspace.root() / "logs" / "stderr";

    ProcessRunner runner(ProcessRunnerOptions{out_path, err_path});
    auto status = runner.run(*CancelContext::background(),
                             {"/bin/sh", "-c", "echo \"$GREETING\"; echo oops >&2"},
                             {{"GREETING", "hello step"}});
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(read_file(out_path), "hello step\n");
    EXPECT_EQ(read_file(err_path), "oops\n");
}

TEST(ProcessRunnerTest, DeadlineKillsChild) {
    ProcessRunner runner;
    auto ctx = CancelContext::with_timeout(CancelContext::background(),
                                           std::chrono::milliseconds(100));
    const auto start = std::chrono::steady_clock::now();
    auto status = runner.run(*ctx, {"/bin/sh", "-c", "exec sleep 30"}, kNoEnvironment);
    ASSERT_TRUE(is_error(status));
    EXPECT_TRUE(is_context_deadline_exceeded(get_error(status)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(ProcessRunnerTest, CanceledContextNeverStarts) {
    TempWorkspace workspace("runner");
    const auto marker = workspace.root() / "ran";
    auto ctx = CancelContext::with_cancel(CancelContext::background());
    ctx->cancel();

    ProcessRunner runner;
    auto status = runner.run(*ctx, {"/bin/sh", "-c", "touch " + marker.string()},
                             kNoEnvironment);
    ASSERT_TRUE(is_error(status));
    EXPECT_TRUE(is_context_canceled(get_error(status)));
    EXPECT_FALSE(std::filesystem::exists(marker));
}

}  // namespace
