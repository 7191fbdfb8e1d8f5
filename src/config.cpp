#include "config.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

static container_mode parse_container_mode(const string &value) {
    string mode = boost::algorithm::to_lower_copy(value);
    if (mode == "auto") return container_mode::AUTO;
    if (mode == "never" || mode == "off" || mode == "0") return container_mode::NEVER;
    throw invalid_argument("SANDBOX_CONTAINER must be auto or never, got " + value);
}

sandbox_config load_config_from_env() {
    sandbox_config config;
    config.image = get_env("SANDBOX_IMAGE", config.image);
    config.memory_limit_mb = get_env_value<int>("SANDBOX_MEMORY_LIMIT_MB", config.memory_limit_mb);
    config.pids_limit = get_env_value<int>("SANDBOX_PIDS_LIMIT", config.pids_limit);
    config.cpu_limit = get_env_value<double>("SANDBOX_CPU_LIMIT", config.cpu_limit);
    config.timeout_seconds = get_env_value<int>("SANDBOX_TIMEOUT_SECONDS", config.timeout_seconds);
    config.max_output_chars = get_env_value<size_t>("SANDBOX_MAX_OUTPUT_CHARS", config.max_output_chars);
    config.runtime = get_env("SANDBOX_RUNTIME", config.runtime);
    config.container_user = get_env("SANDBOX_USER", config.container_user);
    config.dockerfile_dir = get_env("SANDBOX_DOCKERFILE_DIR", config.dockerfile_dir.string());
    config.compile_timeout_seconds = get_env_value<int>("SANDBOX_COMPILE_TIMEOUT_SECONDS", config.compile_timeout_seconds);
    config.compile_memory_limit_mb = get_env_value<int>("SANDBOX_COMPILE_MEMORY_LIMIT_MB", config.compile_memory_limit_mb);
    config.scratch_mb = get_env_value<int>("SANDBOX_SCRATCH_MB", config.scratch_mb);
    config.work_dir = get_env("SANDBOX_WORK_DIR", config.work_dir.string());
    config.mode = parse_container_mode(get_env("SANDBOX_CONTAINER", "auto"));
    validate_config(config);
    return config;
}

void validate_config(const sandbox_config &config) {
    if (config.memory_limit_mb <= 0)
        throw invalid_argument(fmt::format("memory limit must be positive, got {}", config.memory_limit_mb));
    if (config.pids_limit <= 0)
        throw invalid_argument(fmt::format("pids limit must be positive, got {}", config.pids_limit));
    if (config.cpu_limit <= 0)
        throw invalid_argument(fmt::format("cpu limit must be positive, got {}", config.cpu_limit));
    if (config.timeout_seconds <= 0)
        throw invalid_argument(fmt::format("timeout must be positive, got {}", config.timeout_seconds));
    if (config.compile_timeout_seconds <= 0)
        throw invalid_argument(fmt::format("compile timeout must be positive, got {}", config.compile_timeout_seconds));
    if (config.compile_memory_limit_mb <= 0)
        throw invalid_argument(fmt::format("compile memory limit must be positive, got {}", config.compile_memory_limit_mb));
    if (config.scratch_mb <= 0)
        throw invalid_argument(fmt::format("scratch size must be positive, got {}", config.scratch_mb));
    if (config.max_output_chars == 0)
        throw invalid_argument("max output chars must be positive");
    if (config.max_source_bytes != MAX_SOURCE_BYTES)
        throw invalid_argument("max source bytes is fixed and cannot be changed");
    if (config.image.empty())
        throw invalid_argument("sandbox image name must not be empty");
    if (config.container_user.empty() || config.container_user == "0" || boost::algorithm::starts_with(config.container_user, "0:") || config.container_user == "root")
        throw invalid_argument("sandbox container user must not be root");
}

}  // namespace sandbox
