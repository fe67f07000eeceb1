#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/compiler.hpp"
#include "sandbox/rlimit_limiter.hpp"
#include "test/fixture.hpp"

using namespace std;
using namespace pocketjudge;
using namespace pocketjudge::test;
namespace fs = std::filesystem;

class CompilerTest : public ::testing::Test {
protected:
    temp_directory dir;
    shared_ptr<rlimit_limiter> limiter = make_shared<rlimit_limiter>();
};

TEST_F(CompilerTest, BuildCommandSubstitutesAfterSplitting) {
    vector<string> command = compiler::build_command("g++  -O2 {source} -o {output}", "/tmp/a b.cpp", "/tmp/out");
    vector<string> expected = {"g++", "-O2", "/tmp/a b.cpp", "-o", "/tmp/out"};
    EXPECT_EQ(expected, command);
}

TEST_F(CompilerTest, BuildCommandAcceptsShortPlaceholders) {
    vector<string> command = compiler::build_command("cc {src} -o{out}", "x.c", "x");
    vector<string> expected = {"cc", "x.c", "-ox"};
    EXPECT_EQ(expected, command);
}

TEST_F(CompilerTest, BuildCommandRejectsEmptyTemplate) {
    EXPECT_THROW(compiler::build_command("  ", "x.c", "x"), std::invalid_argument);
}

TEST_F(CompilerTest, CompilesAndRemovesWorkDirectory) {
    toolchain_config config = make_test_toolchain(dir.path);
    compiler cc(config.compile_command, config, limiter);

    fs::path workdir;
    {
        compile_result result;
        compiled_artifact artifact = cc.compile("int main() { return 0; }\n", 30, result);
        EXPECT_TRUE(result.success);
        EXPECT_GT(result.time_ms, 0);
        EXPECT_TRUE(fs::is_regular_file(artifact.get_executable()));
        EXPECT_TRUE(artifact.get_executable().is_absolute());
        workdir = artifact.get_workdir();

        // 移动之后只有新的所有者删除工作目录
        compiled_artifact moved = move(artifact);
        EXPECT_EQ(workdir, moved.get_workdir());
        EXPECT_TRUE(fs::exists(workdir));
    }
    EXPECT_FALSE(fs::exists(workdir));
}

TEST_F(CompilerTest, SyntaxErrorIsCompilationError) {
    toolchain_config config = make_test_toolchain(dir.path);
    compiler cc(config.compile_command, config, limiter);

    compile_result result;
    try {
        cc.compile("int main() { return 0 }\n", 30, result);
        FAIL() << "compilation should fail";
    } catch (compilation_error &e) {
        EXPECT_FALSE(e.error_log.empty());
        EXPECT_EQ(e.error_log, result.output);
    }
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(fs::is_empty(dir.path));
}

TEST_F(CompilerTest, CompilerOutputIsTruncated) {
    toolchain_config config = make_script_toolchain(dir.path);
    fs::path noisy = write_script(dir.path, "noisy-compiler.sh", "head -c 100000 /dev/zero | tr '\\0' x\nexit 1\n");
    config.compile_output_limit = 100;
    compiler cc(noisy.string() + " {source} {output}", config, limiter);

    compile_result result;
    EXPECT_THROW(cc.compile("", 30, result), compilation_error);
    EXPECT_EQ(100u, result.output.size());
}

TEST_F(CompilerTest, TimeoutIsCompilationError) {
    toolchain_config config = make_script_toolchain(dir.path);
    fs::path slow = write_script(dir.path, "slow-compiler.sh", "sleep 10\n");
    compiler cc(slow.string() + " {source} {output}", config, limiter);

    compile_result result;
    try {
        cc.compile("", 1, result);
        FAIL() << "compilation should time out";
    } catch (compilation_error &e) {
        EXPECT_NE(string::npos, e.error_log.find("timed out"));
    }
    EXPECT_LT(result.time_ms, 5000);
}

TEST_F(CompilerTest, MissingExecutableIsCompilationError) {
    toolchain_config config = make_script_toolchain(dir.path);
    fs::path lazy = write_script(dir.path, "lazy-compiler.sh", "exit 0\n");
    compiler cc(lazy.string() + " {source} {output}", config, limiter);

    compile_result result;
    EXPECT_THROW(cc.compile("", 30, result), compilation_error);
}

TEST_F(CompilerTest, MissingToolchainIsSpawnError) {
    toolchain_config config = make_test_toolchain(dir.path);
    compiler cc("pocketjudge-no-such-compiler {source} {output}", config, limiter);

    compile_result result;
    EXPECT_THROW(cc.compile("", 30, result), spawn_error);
}
