#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "config.hpp"
#include "language/language.hpp"
#include "monitor/run_options.hpp"

namespace sandbox {

/**
 * @brief 编译器诊断信息和容器运行时输出的最大保留长度
 */
constexpr std::size_t COMPILE_LOG_SIZE = 64 * 1024;

/**
 * @brief 执行策略
 * 负责编译运行已经通过静态检查的源代码。
 * 容器执行和子进程执行的语义相同，评测门面在启动时选定其中一个。
 */
struct executor {
    virtual ~executor() = default;

    /**
     * @brief 编译并运行源代码
     * 每次调用使用独占的工作文件夹，返回之前（包括抛出异常时）删除该文件夹。
     * 多个线程可以同时调用。
     * @param code 已经通过静态检查的源代码
     * @param lang 源代码的语言
     * @param stdin_data 程序的标准输入
     * @throw compilation_error 编译失败，运行步骤不会执行
     * @throw infrastructure_error 容器运行时、编译器或解释器不可用
     */
    virtual raw_run_outcome run(const std::string &code, language lang, const std::string &stdin_data) = 0;

    /**
     * @brief 执行策略的名称，用于日志
     */
    virtual std::string name() const = 0;
};

/**
 * @brief 启动时探测到的沙箱能力
 * 在进程启动时探测一次，之后只读，通过构造函数传给评测门面。
 */
struct sandbox_capabilities {
    /**
     * @brief 容器运行时是否可以连接
     */
    bool container_available = false;

    /**
     * @brief 沙箱镜像是否存在（或者已经成功构建）
     */
    bool image_present = false;

    std::string runtime_version;

    /**
     * @brief 不能使用容器执行的原因
     */
    std::string reason;

    bool use_container() const {
        return container_available && image_present;
    }
};

/**
 * @brief 一次执行的工作文件夹
 *
 * sandbox-[uuid]
 * ├── src // 处理过的源代码和 input.txt
 * └── build // 编译产物，运行时的工作路径
 */
struct workspace {
    std::filesystem::path root, src_dir, build_dir;
    std::string source_filename;

    std::filesystem::path source_file() const;
    std::filesystem::path input_file() const;
};

/**
 * @brief 在 root 中写入处理过的源代码和标准输入
 * root 由调用者创建和删除。
 * @param world_writable_build 编译产物文件夹是否对所有用户可写，容器内的非 root 用户需要写入
 */
workspace write_workspace(const std::filesystem::path &root, language lang, const std::string &code,
                          const std::string &stdin_data, bool world_writable_build);

/**
 * @brief 检查编译步骤的结果
 * @param outcome 编译步骤的运行结果
 * @param time_limit_seconds 编译的时间限制
 * @throw compilation_error 编译超时、内存超限或者编译器返回非 0
 */
void check_compile_outcome(const raw_run_outcome &outcome, double time_limit_seconds);

/**
 * @brief 运行步骤中每个输出流保留的字节数
 * max_output_chars 按字符计数，一个 UTF-8 字符至多 4 个字节。
 */
std::size_t run_stream_size(const sandbox_config &config);

/**
 * @brief 根据探测结果创建执行策略
 * 容器可用时返回 container_executor，否则返回 fallback_executor
 */
std::unique_ptr<executor> make_executor(const sandbox_config &config, const sandbox_capabilities &capabilities);

}  // namespace sandbox
