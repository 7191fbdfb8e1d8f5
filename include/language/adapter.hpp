#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "language/language.hpp"

namespace sandbox {

/**
 * @brief 一种编程语言的编译运行方式
 * 执行器只通过这个接口与编程语言打交道，因此容器执行和子进程执行可以共用同一套命令。
 * 所有命令都是参数列表，直接交给 execvp 执行，不经过 shell。
 *
 * 容器执行时 source_file 位于 /code，build_dir 为 /build；
 * 子进程执行时两者都位于本次执行独占的工作文件夹中。
 */
struct language_adapter {
    virtual ~language_adapter() = default;

    virtual language lang() const = 0;

    /**
     * @brief 源代码的文件名，比如 solution.py
     * Java 要求文件名与 public 类名一致，因此文件名可能依赖于源代码
     * @param code 用户提交的源代码（未经 wrap_source 处理）
     */
    virtual std::string source_filename(const std::string &code) const = 0;

    /**
     * @brief 编译命令
     * @param source_file 源代码路径
     * @param build_dir 编译产物的存放文件夹
     * @return 不需要编译的语言返回空值
     */
    virtual std::optional<std::vector<std::string>> compile_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const;

    /**
     * @brief 运行命令
     * @param source_file 源代码路径
     * @param build_dir 编译产物的存放文件夹
     */
    virtual std::vector<std::string> run_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const = 0;

    /**
     * @brief 在写入文件之前对源代码进行处理
     * 脚本语言在这里注入运行时的模块加载检查，作为静态检查之外的第二道防线。
     */
    virtual std::string wrap_source(const std::string &code) const;
};

/**
 * @brief 查找语言对应的编译运行方式
 * 所有语言的实现都在这里注册，评测系统的其他部分不直接判断语言类型。
 */
const language_adapter &get_adapter(language lang);

}  // namespace sandbox
