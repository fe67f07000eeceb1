#include "gtest/gtest.h"
#include "judge/compiler.hpp"
#include "judge/test_runner.hpp"
#include "sandbox/rlimit_limiter.hpp"
#include "test/fixture.hpp"

using namespace std;
using namespace pocketjudge;
using namespace pocketjudge::test;
namespace fs = std::filesystem;

class TestRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = make_script_toolchain(dir.path);
        limits.time_limit_ms = 500;
        limits.memory_limit_mb = 64;
    }

    compiled_artifact build(const string &script) {
        compiler cc(config.compile_command, config, limiter);
        compile_result result;
        return cc.compile("#!/bin/sh\n" + script, 10, result);
    }

    test_result run(const string &script, const string &input, const string &answer) {
        compiled_artifact artifact = build(script);
        test_runner runner(limiter, config);
        test_case test{7, input, answer, category::PRETESTS};
        return runner.run(artifact, test, limits, diff_checker{});
    }

    temp_directory dir;
    toolchain_config config;
    resource_limits limits;
    shared_ptr<rlimit_limiter> limiter = make_shared<rlimit_limiter>();
};

TEST_F(TestRunnerTest, CorrectOutputIsAccepted) {
    test_result result = run("read a b\necho $((a + b))\n", "1 2\n", "3\n");
    EXPECT_EQ(verdict::ACCEPTED, result.status);
    EXPECT_EQ(7u, result.ordinal);
    EXPECT_EQ(0, result.exit_code);
}

TEST_F(TestRunnerTest, WrongOutputIsWrongAnswer) {
    test_result result = run("echo 4\n", "1 2\n", "3\n");
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_EQ("line 1: expected \"3\", found \"4\"", result.detail);
}

TEST_F(TestRunnerTest, NonZeroExitIsRuntimeError) {
    test_result result = run("echo 3\necho oops >&2\nexit 1\n", "", "3\n");
    EXPECT_EQ(verdict::RUNTIME_ERROR, result.status);
    EXPECT_EQ(1, result.exit_code);
    EXPECT_EQ("oops\n", result.error_log);
    EXPECT_EQ("Exited with code 1", result.detail);
}

TEST_F(TestRunnerTest, SignalIsRuntimeError) {
    test_result result = run("kill -FPE $$\n", "", "");
    EXPECT_EQ(verdict::RUNTIME_ERROR, result.status);
    EXPECT_NE(string::npos, result.detail.find("signal"));
}

TEST_F(TestRunnerTest, TimeoutTakesPriorityOverCrash) {
    test_result result = run("sleep 5\nexit 1\n", "", "");
    EXPECT_EQ(verdict::TIME_LIMIT_EXCEEDED, result.status);
    EXPECT_GE(result.time_ms, limits.time_limit_ms);
}

TEST_F(TestRunnerTest, MissingAnswerIsJudgeErrorWithoutRunning) {
    fs::path marker = dir.path / "ran.txt";
    compiled_artifact artifact = build("echo 3\ntouch " + marker.string() + "\n");
    test_runner runner(limiter, config);
    test_case test{3, "", "", category::SYSTEM, false};
    test_result result = runner.run(artifact, test, limits, diff_checker{});
    EXPECT_EQ(verdict::JUDGE_ERROR, result.status);
    EXPECT_EQ(3u, result.ordinal);
    EXPECT_EQ("answer file missing", result.detail);
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(TestRunnerTest, RunDirectoryIsRemoved) {
    compiled_artifact artifact = build("echo 3 > result.txt\ncat result.txt\n");
    test_runner runner(limiter, config);
    test_result result = runner.run(artifact, {1, "", "3\n", category::SYSTEM}, limits, diff_checker{});
    EXPECT_EQ(verdict::ACCEPTED, result.status);

    size_t entries = 0;
    for (auto &entry : fs::directory_iterator(artifact.get_workdir())) {
        EXPECT_EQ("compile", entry.path().filename().string());
        ++entries;
    }
    EXPECT_EQ(1u, entries);
}

TEST_F(TestRunnerTest, MissingExecutableIsJudgeError) {
    compiled_artifact artifact = build("echo 3\n");
    fs::remove(artifact.get_executable());
    test_runner runner(limiter, config);
    test_result result = runner.run(artifact, {1, "", "3\n", category::SYSTEM}, limits, diff_checker{});
    EXPECT_EQ(verdict::JUDGE_ERROR, result.status);
    EXPECT_FALSE(result.detail.empty());
}

TEST_F(TestRunnerTest, CustomRunReturnsOutput) {
    compiled_artifact artifact = build("read a\necho hello $a\n");
    test_runner runner(limiter, config);
    test_result result = runner.run_custom(artifact, "world\n", limits);
    EXPECT_EQ(verdict::ACCEPTED, result.status);
    EXPECT_EQ("hello world\n", result.detail);
}
