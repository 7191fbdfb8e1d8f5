#pragma once

#include "language/adapter.hpp"

namespace sandbox {

/**
 * @brief 从源代码中找出主类名
 * 优先使用 public class 的类名，其次使用第一个 class 的类名，都找不到时返回 "Solution"。
 */
std::string find_java_class_name(const std::string &code);

/**
 * @brief Java
 * javac 将 class 文件输出到 build_dir，之后以 build_dir 为 classpath 运行主类
 */
struct java_adapter : public language_adapter {
    language lang() const override;
    std::string source_filename(const std::string &code) const override;
    std::optional<std::vector<std::string>> compile_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const override;
    std::vector<std::string> run_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const override;
};

}  // namespace sandbox
