#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace sandbox {

/**
 * @brief 沙箱内所有异常的基类，构造时记录调用栈，便于日志中定位问题
 */
struct sandbox_exception : std::exception {
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱基础设施出错
 * 比如容器运行时不可达、编译器或解释器没有安装、fork 失败等，
 * 与用户代码本身无关。
 */
struct infrastructure_error : public sandbox_exception {
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 表示用户代码编译失败
 * error_log 为编译器输出的原始诊断信息，elapsed_ms 为编译步骤耗费的时间。
 */
struct compilation_error : public sandbox_exception {
    const std::string error_log;
    const double elapsed_ms;

    compilation_error(const std::string &what, const std::string &error_log, double elapsed_ms);
};

}  // namespace sandbox
