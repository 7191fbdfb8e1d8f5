#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "executor/fallback.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

class FallbackExecutorTest : public ::testing::Test {
protected:
    sandbox_config config;

    void SetUp() override {
        config = test_config();
        config.work_dir = make_run_directory(test_work_dir(), "fallback-");
    }

    void TearDown() override {
        remove_directory(config.work_dir);
    }
};

TEST_F(FallbackExecutorTest, NameTest) {
    EXPECT_EQ(fallback_executor(config).name(), "fallback");
}

TEST_F(FallbackExecutorTest, PythonEchoTest) {
    SKIP_WITHOUT("python3");
    fallback_executor executor(config);
    raw_run_outcome outcome = executor.run("print(input())", language::PYTHON, "hello\n");
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "hello\n");
}

TEST_F(FallbackExecutorTest, PythonImportGuardTest) {
    SKIP_WITHOUT("python3");
    // 绕过静态检查的导入在运行时同样会被拦截
    fallback_executor executor(config);
    raw_run_outcome outcome = executor.run("m = 'o' + 's'\nimport importlib", language::PYTHON, "");
    EXPECT_TRUE(outcome.completed());
    EXPECT_NE(outcome.exit_code, 0);
    EXPECT_NE(outcome.stderr_data.find("is not allowed"), string::npos);
}

TEST_F(FallbackExecutorTest, WorkDirectoryCleanedTest) {
    SKIP_WITHOUT("python3");
    fallback_executor executor(config);
    executor.run("print(1)", language::PYTHON, "");
    EXPECT_EQ(count_entries(config.work_dir), 0u);
}

TEST_F(FallbackExecutorTest, CompilationErrorTest) {
    SKIP_WITHOUT("gcc");
    fallback_executor executor(config);
    try {
        executor.run("int main() { return undefined_symbol; }", language::C, "");
        FAIL() << "compilation should fail";
    } catch (compilation_error &ex) {
        EXPECT_NE(ex.error_log.find("undefined_symbol"), string::npos);
        EXPECT_GE(ex.elapsed_ms, 0);
    }
    // 编译失败时工作文件夹同样被删除
    EXPECT_EQ(count_entries(config.work_dir), 0u);
}

TEST_F(FallbackExecutorTest, CompiledProgramTest) {
    SKIP_WITHOUT("gcc");
    fallback_executor executor(config);
    raw_run_outcome outcome = executor.run(
        "#include <stdio.h>\nint main() { int a, b; scanf(\"%d %d\", &a, &b); printf(\"%d\\n\", a + b); return 0; }",
        language::C, "3 4\n");
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "7\n");
}

TEST_F(FallbackExecutorTest, TimeLimitTest) {
    SKIP_WITHOUT("python3");
    config.timeout_seconds = 1;
    fallback_executor executor(config);
    raw_run_outcome outcome = executor.run("while True:\n    pass", language::PYTHON, "");
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_LT(outcome.elapsed_ms, 3000);
}

TEST_F(FallbackExecutorTest, MissingInterpreterTest) {
    // 找不到解释器属于基础设施错误
    if (program_exists("node")) GTEST_SKIP() << "node is installed";
    fallback_executor executor(config);
    EXPECT_THROW(executor.run("console.log(1)", language::JAVASCRIPT, ""), infrastructure_error);
    EXPECT_EQ(count_entries(config.work_dir), 0u);
}
