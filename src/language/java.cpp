#include "language/java.hpp"
#include <regex>
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

string find_java_class_name(const string &code) {
    static const regex public_class(R"(\bpublic\s+(?:final\s+|abstract\s+|static\s+)*class\s+(\w+))");
    static const regex any_class(R"(\bclass\s+(\w+))");

    smatch match;
    if (regex_search(code, match, public_class)) return match[1];
    if (regex_search(code, match, any_class)) return match[1];
    return "Solution";
}

language java_adapter::lang() const {
    return language::JAVA;
}

string java_adapter::source_filename(const string &code) const {
    return find_java_class_name(code) + ".java";
}

optional<vector<string>> java_adapter::compile_command(const filesystem::path &source_file, const filesystem::path &build_dir) const {
    return make_command("javac", "-encoding", "UTF-8", "-d", build_dir, source_file);
}

vector<string> java_adapter::run_command(const filesystem::path &source_file, const filesystem::path &build_dir) const {
    // 串行 GC 减少 JVM 创建的线程数，容器限制了进程数
    return make_command("java", "-XX:+UseSerialGC", "-Xss64m", "-cp", build_dir, source_file.stem());
}

}  // namespace sandbox
