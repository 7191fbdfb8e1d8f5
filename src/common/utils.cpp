#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result || !*result ? def_value : string(result);
}

string trim_copy(const string &str) {
    return boost::algorithm::trim_copy(str);
}

// UTF-8 的后续字节形如 10xxxxxx，其余字节都是一个字符的开始
static bool is_continuation_byte(char c) {
    return ((unsigned char) c & 0xC0) == 0x80;
}

size_t utf8_length(const string &str) {
    size_t length = 0;
    for (char c : str)
        if (!is_continuation_byte(c)) ++length;
    return length;
}

string truncate_utf8(const string &str, size_t max_chars) {
    if (str.size() <= max_chars) return str;
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if (is_continuation_byte(str[i])) continue;
        if (chars == max_chars) return str.substr(0, i);
        ++chars;
    }
    return str;
}

bool program_exists(const string &name) {
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0;

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return duration<chrono::microseconds>().count() / 1000.0;
}

}  // namespace sandbox
