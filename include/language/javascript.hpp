#pragma once

#include "language/adapter.hpp"

namespace sandbox {

/**
 * @brief JavaScript (Node.js)
 * 处理后的程序：
 * 1. 替换 Module._load，加载黑名单中的模块时抛出异常
 * 2. 提供 input() 函数，第一次调用时读入全部标准输入，之后每次返回一行，输入结束时返回 null
 * 3. 用户代码运行在独立的函数作用域中
 */
struct javascript_adapter : public language_adapter {
    language lang() const override;
    std::string source_filename(const std::string &code) const override;
    std::vector<std::string> run_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const override;
    std::string wrap_source(const std::string &code) const override;
};

}  // namespace sandbox
