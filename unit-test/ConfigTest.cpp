#include <cstdlib>
#include <stdexcept>
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace sandbox;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char *key : {"SANDBOX_IMAGE", "SANDBOX_MEMORY_LIMIT_MB", "SANDBOX_PIDS_LIMIT", "SANDBOX_CPU_LIMIT",
                                "SANDBOX_TIMEOUT_SECONDS", "SANDBOX_MAX_OUTPUT_CHARS", "SANDBOX_CONTAINER", "SANDBOX_USER"})
            unsetenv(key);
    }
};

TEST_F(ConfigTest, DefaultValuesTest) {
    sandbox_config config = load_config_from_env();
    EXPECT_EQ(config.memory_limit_mb, 256);
    EXPECT_EQ(config.pids_limit, 50);
    EXPECT_DOUBLE_EQ(config.cpu_limit, 1);
    EXPECT_EQ(config.timeout_seconds, 10);
    EXPECT_EQ(config.max_output_chars, 10000u);
    EXPECT_EQ(config.max_source_bytes, 100u * 1024);
    EXPECT_EQ(config.image, "code-sandbox:latest");
    EXPECT_EQ(config.container_user, "65534:65534");
    EXPECT_EQ(config.mode, container_mode::AUTO);
}

TEST_F(ConfigTest, EnvironmentOverrideTest) {
    setenv("SANDBOX_IMAGE", "my-sandbox:1.0", 1);
    setenv("SANDBOX_MEMORY_LIMIT_MB", "512", 1);
    setenv("SANDBOX_CPU_LIMIT", "0.5", 1);
    setenv("SANDBOX_TIMEOUT_SECONDS", "3", 1);
    setenv("SANDBOX_CONTAINER", "never", 1);

    sandbox_config config = load_config_from_env();
    EXPECT_EQ(config.image, "my-sandbox:1.0");
    EXPECT_EQ(config.memory_limit_mb, 512);
    EXPECT_DOUBLE_EQ(config.cpu_limit, 0.5);
    EXPECT_EQ(config.timeout_seconds, 3);
    EXPECT_EQ(config.mode, container_mode::NEVER);
}

TEST_F(ConfigTest, EmptyEnvironmentValueUsesDefaultTest) {
    setenv("SANDBOX_PIDS_LIMIT", "", 1);
    EXPECT_EQ(load_config_from_env().pids_limit, 50);
}

TEST_F(ConfigTest, InvalidNumberTest) {
    setenv("SANDBOX_MEMORY_LIMIT_MB", "lots", 1);
    EXPECT_THROW(load_config_from_env(), invalid_argument);
}

TEST_F(ConfigTest, NonPositiveLimitTest) {
    setenv("SANDBOX_TIMEOUT_SECONDS", "0", 1);
    EXPECT_THROW(load_config_from_env(), invalid_argument);
}

TEST_F(ConfigTest, InvalidContainerModeTest) {
    setenv("SANDBOX_CONTAINER", "sometimes", 1);
    EXPECT_THROW(load_config_from_env(), invalid_argument);
}

TEST_F(ConfigTest, RootUserRejectedTest) {
    sandbox_config config;
    config.container_user = "0:0";
    EXPECT_THROW(validate_config(config), invalid_argument);
    config.container_user = "root";
    EXPECT_THROW(validate_config(config), invalid_argument);
    config.container_user = "1000:1000";
    EXPECT_NO_THROW(validate_config(config));
}

TEST_F(ConfigTest, SourceSizeIsFixedTest) {
    sandbox_config config;
    config.max_source_bytes = 1024 * 1024;
    EXPECT_THROW(validate_config(config), invalid_argument);
}
