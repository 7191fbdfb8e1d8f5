#pragma once

#include "monitor/run_options.hpp"

namespace sandbox {

/**
 * @brief 在资源监控下运行指定的程序，阻塞直到程序结束
 * 1. 在 fork 之前准备好参数、环境变量和管道，子进程中只调用 async-signal-safe 的函数
 * 2. 子进程：
 *    1. 创建独立的进程组，以便通过一个信号杀死整个进程树
 *    2. 重定向标准输入为 stdin_filename，标准输出和标准错误连接到管道
 *    3. 通过 rlimit 禁止 core dump、限制创建文件的大小
 *    4. 通过 execvp 执行命令（不经过 shell），失败时通过 close-on-exec 管道将 errno 告知父进程
 * 3. 父进程：
 *    1. 启动内存监控线程，每隔 100ms 统计进程树的常驻内存，超限时杀死进程树并发送 MEMORY_EXCEEDED
 *    2. 主线程读取管道，超出 stream_size 的输出被读出后丢弃
 *    3. 超过墙上时钟时间限制时，主线程发送 TIMED_OUT 并杀死进程树
 *    4. 通过 waitid(WNOWAIT) 检测进程退出而不回收，确保监控线程不会向被复用的 pid 发送信号
 *    5. 进程退出后发送 EXITED、等待监控线程结束，最后回收子进程并统计运行时间和内存峰值
 * 4. 终止原因取信道中第一个被发送的值；如果内存超限但运行时间同样达到了时间限制，以时间限制为准
 *
 * 不支持 /proc 的系统上只限制时间，不限制内存。
 *
 * @param opt 运行参数
 * @return 运行结果，timed_out 和 memory_exceeded 至多一个为真
 * @throw infrastructure_error 命令无法执行（比如可执行文件不存在）
 * @throw std::system_error 创建管道、fork 等系统调用失败
 */
raw_run_outcome run_monitored(const run_options &opt);

}  // namespace sandbox
