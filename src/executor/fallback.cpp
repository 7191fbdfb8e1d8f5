#include "executor/fallback.hpp"
#include <algorithm>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "language/adapter.hpp"
#include "monitor/resource_monitor.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

fallback_executor::fallback_executor(const sandbox_config &config) : config(config) {}

string fallback_executor::name() const {
    return "fallback";
}

raw_run_outcome fallback_executor::run(const string &code, language lang, const string &stdin_data) {
    const language_adapter &adapter = get_adapter(lang);
    fs::path root = make_run_directory(config.work_dir, "sandbox-");
    defer { remove_directory(root); };

    workspace ws = write_workspace(root, lang, code, stdin_data, false);

    run_options opt;
    opt.work_dir = ws.build_dir;
    opt.file_limit = (long long) config.scratch_mb * 1024 * 1024;
    opt.env["HOME"] = ws.build_dir.string();
    opt.env["LANG"] = "C.UTF-8";

    if (auto compile = adapter.compile_command(ws.source_file(), ws.build_dir)) {
        run_options compile_opt = opt;
        compile_opt.command = *compile;
        compile_opt.wall_limit = config.compile_timeout_seconds;
        compile_opt.memory_limit_mb = config.compile_memory_limit_mb;
        compile_opt.stream_size = COMPILE_LOG_SIZE;
        check_compile_outcome(run_monitored(compile_opt), config.compile_timeout_seconds);
    }

    opt.command = adapter.run_command(ws.source_file(), ws.build_dir);
    opt.stdin_filename = ws.input_file();
    opt.wall_limit = config.timeout_seconds;
    opt.memory_limit_mb = config.memory_limit_mb;
    opt.stream_size = run_stream_size(config);
    return run_monitored(opt);
}

}  // namespace sandbox
