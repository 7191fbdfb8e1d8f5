#include "executor/executor.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "executor/container.hpp"
#include "executor/fallback.hpp"
#include "language/adapter.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

fs::path workspace::source_file() const {
    return src_dir / source_filename;
}

fs::path workspace::input_file() const {
    return src_dir / "input.txt";
}

workspace write_workspace(const fs::path &root, language lang, const string &code, const string &stdin_data, bool world_writable_build) {
    const language_adapter &adapter = get_adapter(lang);

    workspace ws;
    ws.root = root;
    ws.src_dir = root / "src";
    ws.build_dir = root / "build";
    ws.source_filename = adapter.source_filename(code);

    fs::create_directory(ws.src_dir);
    fs::create_directory(ws.build_dir);

    write_file_content(ws.source_file(), adapter.wrap_source(code));
    write_file_content(ws.input_file(), stdin_data);

    // 工作文件夹本身只有所有者可以访问，容器挂载时只需要 src 和 build 自身的权限
    const auto readable = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;
    fs::permissions(ws.source_file(), readable, fs::perm_options::replace);
    fs::permissions(ws.input_file(), readable, fs::perm_options::replace);
    fs::permissions(ws.src_dir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec, fs::perm_options::replace);
    if (world_writable_build)
        fs::permissions(ws.build_dir, fs::perms::all, fs::perm_options::replace);
    return ws;
}

void check_compile_outcome(const raw_run_outcome &outcome, double time_limit_seconds) {
    string error_log = outcome.stderr_data;
    if (!outcome.stdout_data.empty()) {
        if (!error_log.empty()) error_log += "\n";
        error_log += outcome.stdout_data;
    }

    if (outcome.timed_out)
        throw compilation_error(fmt::format("Compilation timed out after {}s", time_limit_seconds), error_log, outcome.elapsed_ms);
    if (outcome.memory_exceeded)
        throw compilation_error("Compilation exceeded the memory limit", error_log, outcome.elapsed_ms);
    if (outcome.exit_code != 0)
        throw compilation_error(fmt::format("Compiler exited with code {}", outcome.exit_code), error_log, outcome.elapsed_ms);
}

size_t run_stream_size(const sandbox_config &config) {
    return max(config.max_output_chars * 4, COMPILE_LOG_SIZE);
}

unique_ptr<executor> make_executor(const sandbox_config &config, const sandbox_capabilities &capabilities) {
    if (capabilities.use_container()) {
        LOG(INFO) << "using container executor with image " << config.image << " (" << config.runtime << " " << capabilities.runtime_version << ")";
        return make_unique<container_executor>(config);
    } else {
        LOG(WARNING) << "container execution unavailable: " << capabilities.reason << ", falling back to monitored subprocess execution";
        return make_unique<fallback_executor>(config);
    }
}

}  // namespace sandbox
