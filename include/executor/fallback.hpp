#pragma once

#include "executor/executor.hpp"

namespace sandbox {

/**
 * @brief 没有容器运行时时的执行策略
 * 直接在宿主机上通过资源监控编译运行代码，只限制时间、内存和输出，隔离程度低于容器。
 * 因此只在容器探测失败时使用。
 */
struct fallback_executor : public executor {
    explicit fallback_executor(const sandbox_config &config);

    raw_run_outcome run(const std::string &code, language lang, const std::string &stdin_data) override;

    std::string name() const override;

private:
    sandbox_config config;
};

}  // namespace sandbox
