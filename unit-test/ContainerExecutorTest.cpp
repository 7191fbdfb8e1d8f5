#include <algorithm>
#include "executor/container.hpp"
#include "executor/fallback.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace sandbox;

/**
 * @brief 判断参数列表中是否存在连续的 flag value 两项
 */
static bool has_option(const vector<string> &command, const string &flag, const string &value) {
    for (size_t i = 0; i + 1 < command.size(); ++i)
        if (command[i] == flag && command[i + 1] == value) return true;
    return false;
}

static bool contains(const vector<string> &command, const string &value) {
    return find(command.begin(), command.end(), value) != command.end();
}

class ContainerExecutorTest : public ::testing::Test {
protected:
    sandbox_config config;

    void SetUp() override {
        config.memory_limit_mb = 128;
        config.pids_limit = 20;
        config.cpu_limit = 0.5;
        config.timeout_seconds = 5;
        config.compile_timeout_seconds = 30;
        config.compile_memory_limit_mb = 512;
        config.scratch_mb = 16;
        config.image = "code-sandbox:test";
    }
};

TEST_F(ContainerExecutorTest, BaseCommandTest) {
    auto command = container_base_command(config, "sandbox-1234-run", 128);
    ASSERT_GE(command.size(), 3u);
    EXPECT_EQ(command[0], "docker");
    EXPECT_EQ(command[1], "run");
    EXPECT_TRUE(contains(command, "--rm"));
    EXPECT_TRUE(contains(command, "--read-only"));
    EXPECT_TRUE(has_option(command, "--name", "sandbox-1234-run"));
    EXPECT_TRUE(has_option(command, "--network", "none"));
    EXPECT_TRUE(has_option(command, "--memory", "128m"));
    EXPECT_TRUE(has_option(command, "--memory-swap", "128m"));
    EXPECT_TRUE(has_option(command, "--pids-limit", "20"));
    EXPECT_TRUE(has_option(command, "--cpus", "0.5"));
    EXPECT_TRUE(has_option(command, "--tmpfs", "/tmp:rw,noexec,nosuid,size=16m"));
    EXPECT_TRUE(has_option(command, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(has_option(command, "--cap-drop", "ALL"));
    EXPECT_TRUE(has_option(command, "--user", "65534:65534"));
    EXPECT_FALSE(contains(command, "--privileged"));
}

TEST_F(ContainerExecutorTest, CompileCommandTest) {
    auto command = compile_container_command(config, "c1", "/work/src", "/work/build", {"gcc", "/code/solution.c", "-o", "/build/solution"});
    EXPECT_TRUE(has_option(command, "--memory", "512m"));
    EXPECT_TRUE(has_option(command, "-v", "/work/src:/code:ro"));
    EXPECT_TRUE(has_option(command, "-v", "/work/build:/build"));
    EXPECT_FALSE(contains(command, "-i"));

    auto image = find(command.begin(), command.end(), "code-sandbox:test");
    ASSERT_NE(image, command.end());
    vector<string> inner(image + 1, command.end());
    vector<string> expected = {"timeout", "-s", "TERM", "-k", "1", "30", "gcc", "/code/solution.c", "-o", "/build/solution"};
    EXPECT_EQ(inner, expected);
}

TEST_F(ContainerExecutorTest, RunCommandTest) {
    auto command = run_container_command(config, "r1", "/work/src", "/work/build", {"python3", "-B", "/code/solution.py"});
    EXPECT_TRUE(has_option(command, "--memory", "128m"));
    EXPECT_TRUE(contains(command, "-i"));
    EXPECT_TRUE(has_option(command, "-v", "/work/src:/code:ro"));
    EXPECT_TRUE(has_option(command, "-v", "/work/build:/build:ro"));

    // 用户程序的参数在镜像名称之后，不会被当成容器运行时的参数
    auto image = find(command.begin(), command.end(), "code-sandbox:test");
    ASSERT_NE(image, command.end());
    vector<string> inner(image + 1, command.end());
    vector<string> expected = {"timeout", "-s", "TERM", "-k", "1", "5", "python3", "-B", "/code/solution.py"};
    EXPECT_EQ(inner, expected);
}

TEST_F(ContainerExecutorTest, MapTimeoutExitCodeTest) {
    raw_run_outcome outcome;
    outcome.exit_code = TIMEOUT_EXIT_CODE;
    outcome.elapsed_ms = 5100;
    auto mapped = map_container_outcome(outcome, 5);
    EXPECT_TRUE(mapped.timed_out);
    EXPECT_FALSE(mapped.memory_exceeded);
}

TEST_F(ContainerExecutorTest, MapKilledExitCodeTest) {
    raw_run_outcome outcome;
    outcome.exit_code = OOM_KILLED_EXIT_CODE;
    outcome.elapsed_ms = 300;
    auto mapped = map_container_outcome(outcome, 5);
    EXPECT_TRUE(mapped.memory_exceeded);
    EXPECT_FALSE(mapped.timed_out);

    // timeout -k 在宽限期后发送 SIGKILL，此时运行时间已经达到限制
    outcome.elapsed_ms = 6200;
    mapped = map_container_outcome(outcome, 5);
    EXPECT_TRUE(mapped.timed_out);
    EXPECT_FALSE(mapped.memory_exceeded);
}

TEST_F(ContainerExecutorTest, MapNormalExitCodeTest) {
    raw_run_outcome outcome;
    outcome.exit_code = 0;
    EXPECT_TRUE(map_container_outcome(outcome, 5).completed());
    outcome.exit_code = 1;
    auto mapped = map_container_outcome(outcome, 5);
    EXPECT_TRUE(mapped.completed());
    EXPECT_EQ(mapped.exit_code, 1);
}

TEST_F(ContainerExecutorTest, MapHostTimeoutTest) {
    raw_run_outcome outcome;
    outcome.exit_code = 128 + 9;
    outcome.timed_out = true;
    outcome.elapsed_ms = 100;
    auto mapped = map_container_outcome(outcome, 5);
    EXPECT_TRUE(mapped.timed_out);
    EXPECT_FALSE(mapped.memory_exceeded);
}

TEST_F(ContainerExecutorTest, ProbeDisabledTest) {
    config.mode = container_mode::NEVER;
    sandbox_capabilities capabilities = probe_capabilities(config);
    EXPECT_FALSE(capabilities.container_available);
    EXPECT_FALSE(capabilities.use_container());
    EXPECT_FALSE(capabilities.reason.empty());
}

TEST_F(ContainerExecutorTest, ProbeMissingRuntimeTest) {
    config.mode = container_mode::AUTO;
    config.runtime = "code-sandbox-no-such-runtime";
    sandbox_capabilities capabilities;
    EXPECT_NO_THROW(capabilities = probe_capabilities(config));
    EXPECT_FALSE(capabilities.use_container());
    EXPECT_NE(capabilities.reason.find("code-sandbox-no-such-runtime"), string::npos);
}

TEST_F(ContainerExecutorTest, MakeExecutorTest) {
    sandbox_capabilities capabilities;
    EXPECT_EQ(make_executor(config, capabilities)->name(), "fallback");

    capabilities.container_available = true;
    EXPECT_EQ(make_executor(config, capabilities)->name(), "fallback");

    capabilities.image_present = true;
    EXPECT_EQ(make_executor(config, capabilities)->name(), "container");
}

TEST_F(ContainerExecutorTest, ContainerExecutionTest) {
    // 只有在容器运行时和沙箱镜像都可用时才执行
    config.mode = container_mode::AUTO;
    config.work_dir = test_work_dir();
    config.dockerfile_dir = "";
    config.timeout_seconds = 5;
    sandbox_capabilities capabilities = probe_capabilities(config);
    if (!capabilities.use_container()) GTEST_SKIP() << capabilities.reason;

    container_executor executor(config);
    raw_run_outcome outcome = executor.run("print(input())", language::PYTHON, "42\n");
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "42\n");
}
