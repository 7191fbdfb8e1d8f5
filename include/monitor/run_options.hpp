#pragma once

#include <filesystem>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace sandbox {

struct run_options {
    /**
     * @brief 要执行的命令，command[0] 为可执行文件，在 PATH 中查找
     * 命令直接通过 execvp 执行，不经过 shell
     */
    std::vector<std::string> command;

    std::filesystem::path work_dir;

    /**
     * @brief 重定向到子进程标准输入的文件，为空时子进程的标准输入为 /dev/null
     */
    std::filesystem::path stdin_filename;

    /**
     * @brief 墙上时钟时间限制，单位秒
     */
    double wall_limit = 10;

    /**
     * @brief 进程树常驻内存限制，单位 MB，非正数表示不限制
     */
    int memory_limit_mb = 0;

    /**
     * @brief stdout 和 stderr 各自最多保存多少字节，超出的部分被读取后丢弃
     */
    std::size_t stream_size = std::numeric_limits<std::size_t>::max();

    /**
     * @brief 子进程能创建的最大文件大小，单位字节，非正数表示不限制
     */
    long long file_limit = -1;

    /**
     * @brief 子进程的环境变量，子进程不继承父进程的环境变量（PATH 除外）
     */
    std::map<std::string, std::string> env;
};

/**
 * @brief 进程的终止原因，由资源监控的单次信道传递
 */
enum class termination_reason {
    EXITED,
    TIMED_OUT,
    MEMORY_EXCEEDED
};

/**
 * @brief 一次受监控运行的原始结果
 * timed_out、memory_exceeded 至多一个为真；都为假时表示正常结束，exit_code 有效。
 * 由产生它的执行器独占，最终被评测门面转换为 execution_result。
 */
struct raw_run_outcome {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    double elapsed_ms = 0;
    double memory_mb = 0;
    bool timed_out = false;
    bool memory_exceeded = false;

    bool completed() const {
        return !timed_out && !memory_exceeded;
    }
};

}  // namespace sandbox
