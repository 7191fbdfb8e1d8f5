#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 源代码的最大字节数，固定为 100KB，不能通过环境变量修改
 */
constexpr std::size_t MAX_SOURCE_BYTES = 100 * 1024;

/**
 * @brief 是否尝试使用容器执行
 */
enum class container_mode {
    // 启动时探测容器运行时，可用则使用容器，否则退回到受监控的子进程
    AUTO,
    // 总是使用受监控的子进程执行
    NEVER
};

/**
 * @brief 沙箱的全局配置
 * 在进程启动时加载一次，之后只读。执行器和评测门面都持有该配置的副本或常量引用，
 * 运行期间修改配置是不受支持的。
 */
struct sandbox_config {
    /**
     * @brief 程序（包括所有子进程）可以使用的最大内存，单位 MB
     * 容器执行时同时作为 swap 上限，即不允许使用 swap
     */
    int memory_limit_mb = 256;

    /**
     * @brief 容器内允许同时存在的最大进程数
     */
    int pids_limit = 50;

    /**
     * @brief 容器可以使用的 CPU 份额
     */
    double cpu_limit = 1;

    /**
     * @brief 运行步骤的最大墙上时钟时间，单位秒
     */
    int timeout_seconds = 10;

    /**
     * @brief 返回结果中 output 和 error 的最大长度
     */
    std::size_t max_output_chars = 10000;

    std::size_t max_source_bytes = MAX_SOURCE_BYTES;

    /**
     * @brief 沙箱镜像名称
     * 镜像需要包含 python3、node、javac/java、gcc/g++ 以及 coreutils 的 timeout
     */
    std::string image = "code-sandbox:latest";

    /**
     * @brief 容器运行时的可执行文件，兼容 docker 命令行的运行时均可
     */
    std::string runtime = "docker";

    /**
     * @brief 容器内执行用户程序的用户，不能是 root
     */
    std::string container_user = "65534:65534";

    /**
     * @brief 沙箱镜像的 Dockerfile 所在文件夹，镜像不存在时用来构建一次镜像
     */
    std::filesystem::path dockerfile_dir = "docker/sandbox";

    /**
     * @brief 编译步骤的超时时间，单位秒
     */
    int compile_timeout_seconds = 30;

    /**
     * @brief 编译步骤的内存限制，单位 MB
     * 编译器（尤其是 javac 和 g++）所需内存通常比用户程序大。
     */
    int compile_memory_limit_mb = 1024;

    /**
     * @brief 容器内 /tmp 可写临时空间的大小，单位 MB
     */
    int scratch_mb = 64;

    /**
     * @brief 存放每次执行的独立工作文件夹的根目录
     *
     * WORK_DIR
     * ├── sandbox-[uuid] // 一次执行请求独占的文件夹，执行结束后删除
     * │   ├── src // 处理过的源代码和 input.txt，只读挂载到容器的 /code
     * │   └── build // 编译产物，挂载到容器的 /build
     * └── ...
     */
    std::filesystem::path work_dir = std::filesystem::temp_directory_path();

    container_mode mode = container_mode::AUTO;
};

/**
 * @brief 从环境变量加载配置，未设置的项使用默认值
 * @throw std::invalid_argument 环境变量的值不合法
 */
sandbox_config load_config_from_env();

/**
 * @brief 检查配置的合法性
 * @throw std::invalid_argument 配置不合法，比如限制为非正数
 */
void validate_config(const sandbox_config &config);

}  // namespace sandbox
