#pragma once

#include <sys/types.h>
#include <vector>

namespace sandbox {

/**
 * @brief 当前系统是否提供 /proc，用于读取进程的常驻内存
 * 不支持时资源监控只限制时间，不限制内存。
 */
bool process_memory_supported();

/**
 * @brief 查找进程 root 的所有后代进程（不包括 root 本身）
 * 通过扫描 /proc/[pid]/stat 的父进程号建立进程树。
 */
std::vector<pid_t> find_descendants(pid_t root);

/**
 * @brief 统计进程 root 及其所有后代进程的常驻内存之和
 * @return 常驻内存，单位 KB；root 已经不存在时返回 0
 */
long long process_tree_rss_kb(pid_t root);

/**
 * @brief 杀死整个进程树
 * 先向进程组发送 SIGKILL，再逐个杀死可能已经脱离进程组（比如调用了 setsid）的后代进程。
 * 调用方必须确保 root 还没有被回收，否则 pid 可能已经被复用。
 */
void kill_process_tree(pid_t root);

}  // namespace sandbox
