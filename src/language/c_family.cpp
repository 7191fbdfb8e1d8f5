#include "language/c_family.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

c_family_adapter::c_family_adapter(bool cpp) : cpp(cpp) {}

language c_family_adapter::lang() const {
    return cpp ? language::CPP : language::C;
}

string c_family_adapter::source_filename(const string &) const {
    return cpp ? "solution.cpp" : "solution.c";
}

optional<vector<string>> c_family_adapter::compile_command(const filesystem::path &source_file, const filesystem::path &build_dir) const {
    if (cpp)
        return make_command("g++", source_file, "-o", build_dir / "solution", "-O2", "-std=c++17");
    else
        return make_command("gcc", source_file, "-o", build_dir / "solution", "-O2", "-lm");
}

vector<string> c_family_adapter::run_command(const filesystem::path &, const filesystem::path &build_dir) const {
    return make_command(build_dir / "solution");
}

}  // namespace sandbox
