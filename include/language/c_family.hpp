#pragma once

#include "language/adapter.hpp"

namespace sandbox {

/**
 * @brief C 和 C++
 * 编译生成 build_dir/solution，运行时直接执行该文件
 */
struct c_family_adapter : public language_adapter {
    /**
     * @param cpp 为真时使用 g++ 按 C++17 编译，否则使用 gcc 编译并链接数学库
     */
    explicit c_family_adapter(bool cpp);

    language lang() const override;
    std::string source_filename(const std::string &code) const override;
    std::optional<std::vector<std::string>> compile_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const override;
    std::vector<std::string> run_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const override;

private:
    bool cpp;
};

}  // namespace sandbox
