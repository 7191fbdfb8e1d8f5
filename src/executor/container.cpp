#include "executor/container.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "language/adapter.hpp"
#include "monitor/resource_monitor.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

const fs::path CONTAINER_SOURCE_DIR = "/code";
const fs::path CONTAINER_BUILD_DIR = "/build";

// 宿主侧的超时在容器内 timeout 的基础上放宽，容纳容器的启动和销毁时间
static const double CONTAINER_OVERHEAD_SECONDS = 10;
static const double PROBE_TIMEOUT_SECONDS = 30;
static const double IMAGE_BUILD_TIMEOUT_SECONDS = 1800;

/**
 * @brief 执行一条容器运行时命令，不限制内存
 */
static raw_run_outcome run_runtime_command(const vector<string> &command, double wall_limit, size_t stream_size = COMPILE_LOG_SIZE) {
    run_options opt;
    opt.command = command;
    opt.wall_limit = wall_limit;
    opt.stream_size = stream_size;
    return run_monitored(opt);
}

sandbox_capabilities probe_capabilities(const sandbox_config &config) {
    sandbox_capabilities capabilities;
    if (config.mode == container_mode::NEVER) {
        capabilities.reason = "container execution is disabled by configuration";
        return capabilities;
    }

    try {
        auto version = run_runtime_command(make_command(config.runtime, "version", "--format", "{{.Server.Version}}"), PROBE_TIMEOUT_SECONDS);
        if (!version.completed() || version.exit_code != 0) {
            capabilities.reason = fmt::format("{} daemon is not reachable: {}", config.runtime, trim_copy(version.stderr_data));
            return capabilities;
        }
        capabilities.container_available = true;
        capabilities.runtime_version = trim_copy(version.stdout_data);

        auto inspect = run_runtime_command(make_command(config.runtime, "image", "inspect", config.image), PROBE_TIMEOUT_SECONDS);
        if (inspect.completed() && inspect.exit_code == 0) {
            capabilities.image_present = true;
            return capabilities;
        }

        if (!fs::is_directory(config.dockerfile_dir)) {
            capabilities.reason = fmt::format("image {} is missing and Dockerfile directory {} does not exist", config.image, config.dockerfile_dir.string());
            return capabilities;
        }

        LOG(INFO) << "image " << config.image << " not found, building from " << config.dockerfile_dir;
        auto build = run_runtime_command(make_command(config.runtime, "build", "-t", config.image, config.dockerfile_dir), IMAGE_BUILD_TIMEOUT_SECONDS);
        if (build.completed() && build.exit_code == 0) {
            LOG(INFO) << "image " << config.image << " built";
            capabilities.image_present = true;
        } else {
            capabilities.reason = fmt::format("unable to build image {}: {}", config.image, trim_copy(build.stderr_data));
        }
    } catch (exception &ex) {
        capabilities.reason = fmt::format("unable to run {}: {}", config.runtime, ex.what());
        LOG(WARNING) << "container probe failed: " << boost::diagnostic_information(ex);
    }
    return capabilities;
}

vector<string> container_base_command(const sandbox_config &config, const string &name, int memory_limit_mb) {
    string memory = fmt::format("{}m", memory_limit_mb);
    return make_command(
        config.runtime, "run", "--rm",
        "--name", name,
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,
        "--pids-limit", config.pids_limit,
        "--cpus", config.cpu_limit,
        "--read-only",
        "--tmpfs", fmt::format("/tmp:rw,noexec,nosuid,size={}m", config.scratch_mb),
        "--security-opt", "no-new-privileges",
        "--cap-drop", "ALL",
        "--user", config.container_user,
        "--env", "HOME=/tmp",
        "--workdir", "/tmp");
}

vector<string> compile_container_command(const sandbox_config &config, const string &name,
                                         const fs::path &src_dir, const fs::path &build_dir,
                                         const vector<string> &compile_command) {
    auto command = container_base_command(config, name, config.compile_memory_limit_mb);
    append(command, make_command(
        "-v", fmt::format("{}:{}:ro", src_dir.string(), CONTAINER_SOURCE_DIR.string()),
        "-v", fmt::format("{}:{}", build_dir.string(), CONTAINER_BUILD_DIR.string()),
        config.image,
        "timeout", "-s", "TERM", "-k", "1", config.compile_timeout_seconds,
        compile_command));
    return command;
}

vector<string> run_container_command(const sandbox_config &config, const string &name,
                                     const fs::path &src_dir, const fs::path &build_dir,
                                     const vector<string> &run_command) {
    auto command = container_base_command(config, name, config.memory_limit_mb);
    append(command, make_command(
        "-i",
        "-v", fmt::format("{}:{}:ro", src_dir.string(), CONTAINER_SOURCE_DIR.string()),
        "-v", fmt::format("{}:{}:ro", build_dir.string(), CONTAINER_BUILD_DIR.string()),
        config.image,
        "timeout", "-s", "TERM", "-k", "1", config.timeout_seconds,
        run_command));
    return command;
}

raw_run_outcome map_container_outcome(raw_run_outcome outcome, double time_limit_seconds) {
    if (outcome.timed_out || outcome.memory_exceeded) return outcome;

    if (outcome.exit_code == TIMEOUT_EXIT_CODE) {
        outcome.timed_out = true;
    } else if (outcome.exit_code == OOM_KILLED_EXIT_CODE) {
        // timeout -k 发送的 SIGKILL 同样返回 137，运行时间达到限制时以超时为准
        if (outcome.elapsed_ms >= time_limit_seconds * 1000)
            outcome.timed_out = true;
        else
            outcome.memory_exceeded = true;
    }
    return outcome;
}

container_executor::container_executor(const sandbox_config &config) : config(config) {}

string container_executor::name() const {
    return "container";
}

raw_run_outcome container_executor::run_container(const vector<string> &command, const string &container_name,
                                                  double wall_limit, const fs::path &stdin_filename) {
    run_options opt;
    opt.command = command;
    opt.wall_limit = wall_limit + CONTAINER_OVERHEAD_SECONDS;
    opt.stdin_filename = stdin_filename;
    opt.stream_size = run_stream_size(config);
    auto outcome = run_monitored(opt);
    // 监控到的是 docker 客户端的内存，不是容器内程序的内存
    outcome.memory_mb = 0;

    if (outcome.timed_out) {
        // 杀死 docker 客户端并不会停止容器
        LOG(WARNING) << "container " << container_name << " did not finish in time, killing it";
        try {
            auto killed = run_runtime_command(make_command(config.runtime, "kill", container_name), PROBE_TIMEOUT_SECONDS);
            if (killed.exit_code != 0)
                LOG(WARNING) << "unable to kill container " << container_name << ": " << trim_copy(killed.stderr_data);
        } catch (exception &ex) {
            LOG(ERROR) << "unable to kill container " << container_name << ": " << ex.what();
        }
    } else if (outcome.exit_code == RUNTIME_FAILURE_EXIT_CODE) {
        throw infrastructure_error(fmt::format("{} failed to start container: {}", config.runtime, trim_copy(outcome.stderr_data)));
    }
    return outcome;
}

raw_run_outcome container_executor::run(const string &code, language lang, const string &stdin_data) {
    const language_adapter &adapter = get_adapter(lang);
    fs::path root = make_run_directory(config.work_dir, "sandbox-");
    defer { remove_directory(root); };

    workspace ws = write_workspace(root, lang, code, stdin_data, true);
    string container_name = root.filename().string();
    fs::path source_file = CONTAINER_SOURCE_DIR / ws.source_filename;

    if (auto compile = adapter.compile_command(source_file, CONTAINER_BUILD_DIR)) {
        auto command = compile_container_command(config, container_name + "-compile", ws.src_dir, ws.build_dir, *compile);
        auto outcome = run_container(command, container_name + "-compile", config.compile_timeout_seconds, "");
        check_compile_outcome(map_container_outcome(outcome, config.compile_timeout_seconds), config.compile_timeout_seconds);
    }

    auto command = run_container_command(config, container_name + "-run", ws.src_dir, ws.build_dir, adapter.run_command(source_file, CONTAINER_BUILD_DIR));
    auto outcome = run_container(command, container_name + "-run", config.timeout_seconds, ws.input_file());
    return map_container_outcome(outcome, config.timeout_seconds);
}

}  // namespace sandbox
