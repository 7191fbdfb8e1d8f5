#include "language/python.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

// 只拦截用户代码 (__main__) 中的绝对导入和直接调用 __import__，标准库内部的导入照常进行
static const char *IMPORT_GUARD = R"py(import builtins as __sandbox_builtins


def __sandbox_install_import_guard():
    blocked = frozenset([
        'os', 'subprocess', 'shutil', 'socket', 'ctypes', 'cffi', 'multiprocessing',
        'pty', 'signal', 'importlib', 'requests', 'urllib', 'urllib2', 'urllib3', 'http',
        'ftplib', 'smtplib', 'telnetlib', 'pickle', 'marshal', 'shelve', 'resource',
        'fcntl', 'posix', 'builtins', 'tempfile', 'pathlib', 'glob', 'mmap', 'select',
        'asyncio', '_thread', 'gc', 'inspect', 'code', 'codeop', 'runpy',
    ])
    original_import = __sandbox_builtins.__import__

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level == 0 and (globals is None or globals.get('__name__') == '__main__'):
            if name.split('.')[0] in blocked:
                raise ImportError("Import of module '%s' is not allowed" % name)
        return original_import(name, globals, locals, fromlist, level)

    __sandbox_builtins.__import__ = guarded_import


__sandbox_install_import_guard()
del __sandbox_install_import_guard
del __sandbox_builtins

)py";

language python_adapter::lang() const {
    return language::PYTHON;
}

string python_adapter::source_filename(const string &) const {
    return "solution.py";
}

vector<string> python_adapter::run_command(const filesystem::path &source_file, const filesystem::path &) const {
    // -B: 不写入 .pyc，源代码所在的文件夹是只读的
    return make_command("python3", "-B", source_file);
}

string python_adapter::wrap_source(const string &code) const {
    return IMPORT_GUARD + code + "\n";
}

}  // namespace sandbox
