#pragma once

namespace sandbox {

/**
 * @brief 表示一次执行请求的最终结果
 * 每个执行请求都会落到其中一个终止状态上。
 */
enum class status {
    /**
     * @brief 程序正常运行结束，退出码为 0
     */
    COMPLETED = 0,

    /**
     * @brief 程序以非零退出码结束，或者被信号终止
     * 错误信息为程序的 stderr 输出。
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 用户程序编译错误
     * 错误信息为编译器的诊断输出，运行步骤不会执行。
     */
    COMPILATION_ERROR = 2,

    /**
     * @brief 程序运行的墙上时钟时间超出限制
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 程序（包括其所有子进程）的常驻内存超出限制
     * 对于容器执行，表示程序被内核的 OOM killer 杀死。
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 代码包含被禁止的危险结构，没有被执行
     */
    SECURITY_VIOLATION = 5,

    /**
     * @brief 不支持的编程语言，没有被执行
     */
    UNSUPPORTED_LANGUAGE = 6,

    /**
     * @brief 内部错误，沙箱出错
     * 比如容器运行时不可达，编译器或解释器没有安装。
     */
    SYSTEM_ERROR = 7
};

const char *get_display_message(status);

}  // namespace sandbox
