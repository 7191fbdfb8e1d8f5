#include "monitor/process_tree.hpp"
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <glog/logging.h>
#include <map>
#include <sstream>
#include <string>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

bool process_memory_supported() {
    static const bool supported = fs::exists("/proc/self/stat") && fs::exists("/proc/self/statm");
    return supported;
}

/**
 * @brief 读取 /proc/[pid]/stat 中的父进程号
 * 进程名 comm 可能含有空格和括号，因此从最后一个 ')' 之后开始解析
 * @return 父进程号，进程不存在时返回 -1
 */
static pid_t read_parent_pid(pid_t pid) {
    string stat = read_file_content(fs::path("/proc") / std::to_string(pid) / "stat", "");
    auto idx = stat.rfind(')');
    if (idx == string::npos) return -1;
    istringstream ss(stat.substr(idx + 1));
    char state;
    pid_t ppid;
    if (!(ss >> state >> ppid)) return -1;
    return ppid;
}

static long long read_rss_kb(pid_t pid) {
    static const long page_kb = sysconf(_SC_PAGESIZE) / 1024;
    ifstream fin("/proc/" + std::to_string(pid) + "/statm");
    long long size, resident;
    if (!(fin >> size >> resident)) return 0;
    return resident * page_kb;
}

vector<pid_t> find_descendants(pid_t root) {
    multimap<pid_t, pid_t> children;
    error_code ec;
    for (auto it = fs::directory_iterator("/proc", ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        string name = it->path().filename().string();
        if (!is_integer(name)) continue;
        pid_t pid = stoi(name);
        pid_t ppid = read_parent_pid(pid);
        if (ppid > 0) children.emplace(ppid, pid);
    }

    vector<pid_t> result;
    vector<pid_t> stack{root};
    while (!stack.empty()) {
        pid_t parent = stack.back();
        stack.pop_back();
        auto [begin, end] = children.equal_range(parent);
        for (auto it = begin; it != end; ++it) {
            result.push_back(it->second);
            stack.push_back(it->second);
        }
    }
    return result;
}

long long process_tree_rss_kb(pid_t root) {
    long long total = read_rss_kb(root);
    if (total == 0) return 0;
    for (pid_t pid : find_descendants(root))
        total += read_rss_kb(pid);
    return total;
}

void kill_process_tree(pid_t root) {
    vector<pid_t> descendants;
    if (process_memory_supported())
        descendants = find_descendants(root);

    if (kill(-root, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << root << ": " << strerror(errno);
    if (kill(root, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process " << root << ": " << strerror(errno);

    for (pid_t pid : descendants)
        kill(pid, SIGKILL);
}

}  // namespace sandbox
