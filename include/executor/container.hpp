#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "executor/executor.hpp"

namespace sandbox {

/**
 * @brief 容器内源代码的挂载位置，只读
 */
extern const std::filesystem::path CONTAINER_SOURCE_DIR;

/**
 * @brief 容器内编译产物的挂载位置，编译时可写，运行时只读
 */
extern const std::filesystem::path CONTAINER_BUILD_DIR;

/**
 * @brief 容器内 timeout 命令超时退出时的返回值
 */
constexpr int TIMEOUT_EXIT_CODE = 124;

/**
 * @brief 进程被 SIGKILL 杀死时的返回值 (128 + 9)，容器内一般表示被内核 OOM killer 杀死
 */
constexpr int OOM_KILLED_EXIT_CODE = 137;

/**
 * @brief 容器运行时自身出错（比如镜像不存在、守护进程出错）时的返回值
 */
constexpr int RUNTIME_FAILURE_EXIT_CODE = 125;

/**
 * @brief 探测容器运行时和沙箱镜像
 * 1. 执行 <runtime> version 确认运行时可以连接
 * 2. 执行 <runtime> image inspect <image> 确认镜像存在
 * 3. 镜像不存在时执行一次 <runtime> build -t <image> <dockerfile_dir>
 * mode 为 NEVER 时直接返回不可用。
 * 任何一步失败都只会记录在 reason 中，不会抛出异常。
 */
sandbox_capabilities probe_capabilities(const sandbox_config &config);

/**
 * @brief 所有容器调用共用的参数
 * 禁用网络、限制内存（不允许使用 swap）、进程数和 CPU，根文件系统只读，
 * /tmp 为不可执行的小容量 tmpfs，禁止提权，去掉所有 capabilities，以非 root 用户运行。
 * @param name 容器名称，超时时用来杀死容器
 * @param memory_limit_mb 容器的内存限制
 */
std::vector<std::string> container_base_command(const sandbox_config &config, const std::string &name, int memory_limit_mb);

/**
 * @brief 编译步骤的容器调用
 * 源代码只读挂载到 /code，编译产物文件夹可写挂载到 /build
 */
std::vector<std::string> compile_container_command(const sandbox_config &config, const std::string &name,
                                                   const std::filesystem::path &src_dir, const std::filesystem::path &build_dir,
                                                   const std::vector<std::string> &compile_command);

/**
 * @brief 运行步骤的容器调用
 * 源代码和编译产物都只读挂载，程序在 timeout 命令下运行，标准输入通过 -i 传入
 */
std::vector<std::string> run_container_command(const sandbox_config &config, const std::string &name,
                                               const std::filesystem::path &src_dir, const std::filesystem::path &build_dir,
                                               const std::vector<std::string> &run_command);

/**
 * @brief 将容器调用的返回值转换为运行结果
 * 124 表示容器内的 timeout 命令超时；137 表示程序被 SIGKILL 杀死，
 * 运行时间未达到时间限制时视为内存超限，否则视为超时。
 * @param outcome 容器调用的原始结果，宿主侧的超时标记会保留
 * @param time_limit_seconds 运行步骤的时间限制
 */
raw_run_outcome map_container_outcome(raw_run_outcome outcome, double time_limit_seconds);

/**
 * @brief 在容器中编译运行代码
 */
struct container_executor : public executor {
    explicit container_executor(const sandbox_config &config);

    raw_run_outcome run(const std::string &code, language lang, const std::string &stdin_data) override;

    std::string name() const override;

private:
    sandbox_config config;

    /**
     * @brief 执行一次容器调用，宿主侧超时时通过容器名称杀死容器
     */
    raw_run_outcome run_container(const std::vector<std::string> &command, const std::string &container_name,
                                  double wall_limit, const std::filesystem::path &stdin_filename);
};

}  // namespace sandbox
