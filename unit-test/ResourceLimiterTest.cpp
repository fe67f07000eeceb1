#include <signal.h>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/cgroup_limiter.hpp"
#include "sandbox/rlimit_limiter.hpp"
#include "test/fixture.hpp"

using namespace std;
using namespace pocketjudge;
using namespace pocketjudge::test;

// 每个用例分别在 rlimit 与 cgroup 两种限制器上运行，cgroup 需要 root 与 cgroup v1
class ResourceLimiterTest : public ::testing::TestWithParam<string> {
protected:
    void SetUp() override {
        if (GetParam() == "cgroup" && (getuid() != 0 || !std::filesystem::is_directory("/sys/fs/cgroup/memory")))
            GTEST_SKIP() << "cgroup v1 memory hierarchy is not available";
        limiter = make_resource_limiter(GetParam());
    }

    execution_result run_shell(const string &script, const string &input = "", uint32_t time_limit_ms = 1000) {
        run_limits limits;
        limits.time_limit_ms = time_limit_ms;
        limits.memory_limit_mb = 64;
        limits.output_limit_kb = 1024;
        limits.diagnostic_limit = 16;
        return limiter->run({"/bin/sh", "-c", script}, input, limits, dir.path);
    }

    temp_directory dir;
    shared_ptr<resource_limiter> limiter;
};

TEST_P(ResourceLimiterTest, CapturesStandardStreams) {
    execution_result result = run_shell("read x; echo out $x; echo err >&2", "42\n");
    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(0, result.signal);
    EXPECT_FALSE(result.crashed);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ("out 42\n", result.output);
    EXPECT_EQ("err\n", result.error_output);
}

TEST_P(ResourceLimiterTest, TruncatesStandardError) {
    execution_result result = run_shell("printf '%0100d' 0 >&2");
    EXPECT_EQ(16u, result.error_output.size());
}

TEST_P(ResourceLimiterTest, NonZeroExitIsCrash) {
    execution_result result = run_shell("exit 3");
    EXPECT_EQ(3, result.exit_code);
    EXPECT_EQ(0, result.signal);
    EXPECT_TRUE(result.crashed);
    EXPECT_FALSE(result.timed_out);
}

TEST_P(ResourceLimiterTest, SignalTerminationIsCrash) {
    execution_result result = run_shell("kill -SEGV $$");
    EXPECT_EQ(SIGSEGV, result.signal);
    EXPECT_EQ(128 + SIGSEGV, result.exit_code);
    EXPECT_TRUE(result.crashed);
}

TEST_P(ResourceLimiterTest, WallClockTimeout) {
    execution_result result = run_shell("sleep 10", "", 300);
    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(result.time_ms, 300);
    EXPECT_LT(result.time_ms, 3000);
    EXPECT_EQ(SIGKILL, result.signal);
}

TEST_P(ResourceLimiterTest, TimeoutKillsWholeProcessGroup) {
    execution_result result = run_shell("(sleep 10; echo leaked > leaked.txt) & sleep 10", "", 200);
    EXPECT_TRUE(result.timed_out);
    usleep(300000);
    EXPECT_FALSE(std::filesystem::exists(dir.path / "leaked.txt"));
}

TEST_P(ResourceLimiterTest, MissingExecutableThrowsSpawnError) {
    run_limits limits;
    EXPECT_THROW(limiter->run({(dir.path / "missing").string()}, "", limits, dir.path), spawn_error);
    EXPECT_THROW(limiter->run({"pocketjudge-no-such-command"}, "", limits, dir.path), spawn_error);
}

TEST_P(ResourceLimiterTest, NonExecutableFileThrowsSpawnError) {
    write_file_content(dir.path / "data.txt", "not a program");
    run_limits limits;
    EXPECT_THROW(limiter->run({(dir.path / "data.txt").string()}, "", limits, dir.path), spawn_error);
}

TEST_P(ResourceLimiterTest, OutputLimitRaisesFileSizeSignal) {
    execution_result result = run_shell("head -c 2000000 /dev/zero");
    EXPECT_TRUE(result.crashed);
    EXPECT_TRUE(result.output_truncated);
    EXPECT_LE(result.output.size(), 1024u * 1024u);
}

TEST_P(ResourceLimiterTest, MemoryOverrunIsReported) {
    // 在 shell 变量中保存 128MB 的数据，超过 64MB 的内存限制
    execution_result result = run_shell("x=$(head -c 134217728 /dev/zero | tr '\\0' a); echo ${#x}", "", 5000);
    EXPECT_TRUE(result.memory_exceeded);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ("", result.output);
}

INSTANTIATE_TEST_SUITE_P(Limiters, ResourceLimiterTest, ::testing::Values("rlimit", "cgroup"));

TEST(FindExecutableTest, SearchesPath) {
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_EQ("./a.out", find_executable("./a.out"));
    EXPECT_EQ("", find_executable("pocketjudge-no-such-command"));
}

TEST(ReadPeakRssTest, ReadsCurrentProcess) {
    EXPECT_GT(read_peak_rss_kb(getpid()), 0u);
}

TEST(MakeResourceLimiterTest, CreatesByName) {
    EXPECT_EQ("rlimit", make_resource_limiter("rlimit")->name());
    EXPECT_EQ("cgroup", make_resource_limiter("cgroup")->name());
    EXPECT_THROW(make_resource_limiter("docker"), std::invalid_argument);
}

TEST(OomControlTest, ReadsKillCount) {
    EXPECT_EQ(2u, parse_oom_kill_count("oom_kill_disable 0\nunder_oom 0\noom_kill 2\n"));
    EXPECT_EQ(0u, parse_oom_kill_count("oom_kill_disable 0\nunder_oom 0\noom_kill 0\n"));
}

TEST(OomControlTest, MissingKillCountIsZero) {
    // 4.13 之前的内核没有 oom_kill 字段
    EXPECT_EQ(0u, parse_oom_kill_count("oom_kill_disable 0\nunder_oom 1\n"));
    EXPECT_EQ(0u, parse_oom_kill_count(""));
}
