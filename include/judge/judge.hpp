#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "config.hpp"
#include "executor/executor.hpp"

namespace sandbox {

/**
 * @brief 一次执行请求
 */
struct execution_request {
    std::string code;

    /**
     * @brief 语言名称，不区分大小写，必须是 python、javascript、java、c、cpp 之一
     */
    std::string language;

    std::string stdin_data;
};

/**
 * @brief 一次执行请求的结果，返回给调用者
 * 每个请求都会得到一个完整的结果，不会出现只填充了一部分的结果。
 */
struct execution_result {
    /**
     * @brief 程序是否正常结束且退出码为 0
     */
    bool success = false;

    /**
     * @brief 程序的标准输出，截断到 max_output_chars 并去掉首尾空白
     */
    std::string output;

    /**
     * @brief 错误信息，比如程序的标准错误输出、编译器的诊断信息、超时提示
     */
    std::optional<std::string> error;

    /**
     * @brief 运行时间，编译失败时为编译步骤的时间，请求被拒绝时为 0
     */
    double execution_time_ms = 0;

    /**
     * @brief 内存峰值，无法测量时为空
     */
    std::optional<double> memory_usage_mb;

    sandbox::status status = sandbox::status::SYSTEM_ERROR;
};

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 评测门面，执行代码的唯一入口
 * 1. 检查语言是否支持
 * 2. 静态检查源代码，被拒绝时直接返回，不执行任何程序
 * 3. 交给构造时选定的执行策略编译运行
 * 4. 将运行结果转换为 execution_result
 *
 * 除了只读的配置和执行策略以外没有共享状态，多个线程可以同时调用 execute。
 */
struct judge {
    /**
     * @brief 根据启动时的探测结果选择执行策略
     */
    judge(const sandbox_config &config, const sandbox_capabilities &capabilities);

    /**
     * @brief 使用给定的执行策略
     */
    judge(const sandbox_config &config, std::unique_ptr<executor> &&strategy);

    /**
     * @brief 执行一次请求
     * 不会抛出异常，所有错误都转换为 success 为假的结果。
     */
    execution_result execute(const execution_request &request);

    std::string strategy_name() const;

    const sandbox_config &get_config() const;

private:
    sandbox_config config;
    std::unique_ptr<executor> strategy;

    execution_result normalize(const raw_run_outcome &outcome) const;
    execution_result reject(sandbox::status status, const std::string &message) const;
};

}  // namespace sandbox
