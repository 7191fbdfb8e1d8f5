#include "language/javascript.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

// 标准输入在运行时读取，不会被拼接进源代码
static const char *PRELUDE = R"js(const input = (function () {
    const fs = require('fs');
    const Module = require('module');
    const blocked = new Set([
        'child_process', 'fs', 'net', 'http', 'https', 'http2', 'dgram', 'cluster',
        'worker_threads', 'vm', 'os', 'v8', 'inspector', 'module', 'process', 'tls',
        'dns', 'repl', 'perf_hooks', 'async_hooks', 'wasi', 'trace_events',
    ]);
    const originalLoad = Module._load;
    Module._load = function (request, parent, isMain) {
        const name = String(request).replace(/^node:/, '').split('/')[0];
        if (blocked.has(name)) {
            throw new Error("Module '" + request + "' is not allowed");
        }
        return originalLoad.apply(this, arguments);
    };

    let lines = null;
    let index = 0;
    return function input() {
        if (lines === null) {
            let data = '';
            try {
                data = fs.readFileSync(0, 'utf8');
            } catch (e) {
                data = '';
            }
            lines = data.split(/\r?\n/);
            if (lines.length > 0 && lines[lines.length - 1] === '') {
                lines.pop();
            }
        }
        return index < lines.length ? lines[index++] : '';
    };
})();

(function () {
)js";

static const char *EPILOGUE = R"js(
})();
)js";

language javascript_adapter::lang() const {
    return language::JAVASCRIPT;
}

string javascript_adapter::source_filename(const string &) const {
    return "solution.js";
}

vector<string> javascript_adapter::run_command(const filesystem::path &source_file, const filesystem::path &) const {
    return make_command("node", source_file);
}

string javascript_adapter::wrap_source(const string &code) const {
    return PRELUDE + code + EPILOGUE;
}

}  // namespace sandbox
