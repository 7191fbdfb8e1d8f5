#include "judge/sanitizer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <map>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

security_pattern::security_pattern(const string &category, const string &message, const string &expression)
    : category(category), message(message),
      matcher(expression, boost::regex::perl | boost::regex::icase) {}

// (^|[^.\w]) 用来保证匹配的是独立的标识符而不是成员访问，perl 语法下 ^ 也匹配每一行的行首
static const char *SYSTEM_PATH = R"re(['"`]\s*/(etc|proc|sys|dev|root|boot|var|usr|bin|sbin|home|lib|lib64|run|mnt)(/|['"`]))re";

static vector<security_pattern> make_python_patterns() {
    vector<security_pattern> patterns;
    patterns.emplace_back("blocked_import", "Importing system, process or network modules is not allowed",
        R"re((^|[^.\w])(import\s+([\w.]+(\s+as\s+\w+)?\s*,\s*)*|from\s+)(os|subprocess|shutil|socket|ctypes|cffi|multiprocessing|pty|signal|importlib|requests|urllib|urllib2|urllib3|http|ftplib|smtplib|telnetlib|pickle|marshal|shelve|resource|fcntl|posix|builtins|tempfile|pathlib|glob|mmap|select|asyncio|_thread|gc|inspect|code|codeop|runpy)\b)re");
    patterns.emplace_back("dynamic_import", "Dynamic imports are not allowed",
        R"re(__import__|(^|[^.\w])import_module\s*\()re");
    patterns.emplace_back("dynamic_eval", "Dynamic code evaluation is not allowed",
        R"re((^|[^.\w])(eval|exec|compile|breakpoint)\s*\()re");
    patterns.emplace_back("introspection", "Access to interpreter internals is not allowed",
        R"re(__(builtins|subclasses|globals|code|bases|mro|loader|spec|closure)__|(^|[^.\w])sys\s*\.\s*(modules|_getframe|settrace|setprofile|meta_path|path_hooks)\b|(^|[^.\w])(globals|locals|vars)\s*\()re");
    patterns.emplace_back("system_path", "Access to system paths is not allowed", SYSTEM_PATH);
    return patterns;
}

static vector<security_pattern> make_javascript_patterns() {
    vector<security_pattern> patterns;
    patterns.emplace_back("blocked_module", "Loading system, process or network modules is not allowed",
        R"re((require\s*\(\s*|from\s+|import\s+)['"`](node:)?(child_process|fs|fs/promises|net|http|https|http2|dgram|cluster|worker_threads|vm|os|v8|inspector|module|process|tls|dns|repl|perf_hooks|async_hooks|wasi|trace_events)['"`])re");
    patterns.emplace_back("dynamic_import", "Dynamic module loading is not allowed",
        R"re((^|[^.\w])import\s*\(|(^|[^.\w])require\s*\(\s*[^'"`\s)]|(^|[^.\w])require\s*\.\s*(cache|resolve|main))re");
    patterns.emplace_back("dynamic_eval", "Dynamic code evaluation is not allowed",
        R"re((^|[^.\w])eval\s*\(|new\s+function\s*\(|\.\s*constructor\s*\(|set(timeout|interval|immediate)\s*\(\s*['"`])re");
    patterns.emplace_back("process_access", "Access to the host process is not allowed",
        R"re((^|[^.\w])process\s*(\.\s*|\[\s*['"`])(binding|_linkedbinding|dlopen|kill|env|mainmodule|chdir|setuid|setgid|seteuid|setegid|setgroups|initgroups|umask|abort|reallyexit|_kill|execpath|execve|_getactivehandles|report)\b)re");
    patterns.emplace_back("system_path", "Access to system paths is not allowed", SYSTEM_PATH);
    return patterns;
}

static vector<security_pattern> make_java_patterns() {
    vector<security_pattern> patterns;
    patterns.emplace_back("process_exec", "Executing external processes is not allowed",
        R"re(Runtime\s*\.\s*getRuntime|\bProcessBuilder\b|\bProcessHandle\b)re");
    patterns.emplace_back("network", "Network access is not allowed",
        R"re(\bjava\s*\.\s*net\b|\b(Socket|ServerSocket|DatagramSocket|SocketChannel|HttpURLConnection|URLConnection|HttpClient)\b)re");
    patterns.emplace_back("filesystem", "File system access is not allowed",
        R"re(\bjava\s*\.\s*nio\s*\.\s*file\b|\b(FileInputStream|FileOutputStream|FileReader|FileWriter|RandomAccessFile|FileChannel)\b|new\s+File\s*\(|\bFiles\s*\.\s*(read|write|newBuffered|lines|list|walk|delete|copy|move|create|exists))re");
    patterns.emplace_back("reflection", "Reflection is not allowed",
        R"re(\bjava\s*\.\s*lang\s*\.\s*(reflect|invoke)\b|\.\s*getDeclared(Method|Field|Constructor)s?\s*\(|\.\s*setAccessible\s*\(|\bClass\s*\.\s*forName\s*\(|\bMethodHandles\b|\.\s*getMethod\s*\(|\bClassLoader\b)re");
    patterns.emplace_back("low_level", "Low-level system access is not allowed",
        R"re(\bsun\s*\.\s*misc\b|\bjdk\s*\.\s*internal\b|\bUnsafe\b|System\s*\.\s*(loadLibrary|load|setSecurityManager|getenv)\s*\(|\bnative\s+\w+\s+\w+\s*\()re");
    patterns.emplace_back("system_path", "Access to system paths is not allowed", SYSTEM_PATH);
    return patterns;
}

static vector<security_pattern> make_c_family_patterns(bool cpp) {
    vector<security_pattern> patterns;
    patterns.emplace_back("blocked_header", "Including system headers is not allowed",
        R"re(#\s*include\s*[<"]\s*(unistd\.h|sys/[\w./]+|signal\.h|csignal|netinet/[\w./]+|arpa/[\w./]+|netdb\.h|dlfcn\.h|spawn\.h|fcntl\.h|pthread\.h|linux/[\w./]+|asm/[\w./]+|dirent\.h|termios\.h|pwd\.h|grp\.h|poll\.h|seccomp\.h)\s*[>"])re");
    patterns.emplace_back("process_exec", "Executing external processes is not allowed",
        R"re((^|[^.\w])(system|popen|execl|execlp|execle|execv|execvp|execvpe|execve|fexecve|fork|vfork|clone|clone3|posix_spawn|posix_spawnp|daemon|kill|raise)\s*\()re");
    // bind 之前允许 "::"，std::bind 是合法的函数对象工具
    patterns.emplace_back("network", "Network access is not allowed",
        R"re((^|[^.\w])(socket|socketpair|accept4|gethostbyname|getaddrinfo|sendto|recvfrom|sendmsg|recvmsg)\s*\(|(^|[^:.\w])bind\s*\()re");
    if (cpp) {
        // std::remove 是标准库算法，因此 remove 只匹配没有 "::" 限定的调用
        patterns.emplace_back("filesystem", "File system access is not allowed",
            R"re((^|[^:.\w])(fopen|freopen|open|openat|creat|remove|unlink|unlinkat|rename|renameat|rmdir|mkdir|chmod|chown|truncate|opendir|symlink)\s*\(|::\s*(fopen|freopen|open|openat|creat|unlink|rename|rmdir|mkdir|chmod|chown|truncate|opendir|symlink)\s*\(|\b[io]?fstream\b|#\s*include\s*<\s*(filesystem|fstream|experimental/filesystem)\s*>|\bfilesystem\s*::)re");
    } else {
        patterns.emplace_back("filesystem", "File system access is not allowed",
            R"re((^|[^.\w])(fopen|freopen|open|openat|creat|remove|unlink|unlinkat|rename|renameat|rmdir|mkdir|chmod|chown|truncate|opendir|symlink)\s*\()re");
    }
    patterns.emplace_back("low_level", "Low-level system access is not allowed",
        R"re(\b(asm|__asm|__asm__)\b|(^|[^.\w])(syscall|ptrace|mmap|mprotect|prctl|dlopen|dlsym)\s*\()re");
    patterns.emplace_back("system_path", "Access to system paths is not allowed", SYSTEM_PATH);
    return patterns;
}

const vector<security_pattern> &security_patterns(language lang) {
    // 局部静态变量的初始化是线程安全的
    static const map<language, vector<security_pattern>> tables = {
        {language::PYTHON, make_python_patterns()},
        {language::JAVASCRIPT, make_javascript_patterns()},
        {language::JAVA, make_java_patterns()},
        {language::C, make_c_family_patterns(false)},
        {language::CPP, make_c_family_patterns(true)}};
    return tables.at(lang);
}

sanitize_result sanitize(const string &code, language lang, size_t max_source_bytes) {
    sanitize_result result;
    if (code.size() > max_source_bytes) {
        result.ok = false;
        result.finding = security_finding{
            "source_too_large",
            fmt::format("Source code exceeds maximum size of {} bytes", max_source_bytes),
            ""};
        return result;
    }

    if (!utf8_check_is_valid(code)) {
        result.ok = false;
        result.finding = security_finding{"invalid_encoding", "Source code must be valid UTF-8", ""};
        return result;
    }

    for (auto &pattern : security_patterns(lang)) {
        boost::smatch match;
        bool matched;
        try {
            matched = boost::regex_search(code, match, pattern.matcher);
        } catch (boost::regex_error &ex) {
            // 匹配过程超出了回溯或者内存的上限
            result.ok = false;
            result.finding = security_finding{"unscannable", "Source code is too complex to be checked", ""};
            LOG(WARNING) << "unable to check " << to_string(lang) << " source against " << pattern.category << ": " << ex.what();
            return result;
        }
        if (matched) {
            result.ok = false;
            result.finding = security_finding{pattern.category, pattern.message, trim_copy(match.str(0))};
            LOG(INFO) << "rejected " << to_string(lang) << " source: " << pattern.category << " matched \"" << result.finding->matched_text << "\"";
            return result;
        }
    }
    return result;
}

}  // namespace sandbox
