#pragma once

#include "language/adapter.hpp"

namespace sandbox {

/**
 * @brief Python 3
 * 运行前替换 builtins.__import__，用户代码导入黑名单中的模块时抛出 ImportError，
 * 标准库内部的导入不受影响。
 */
struct python_adapter : public language_adapter {
    language lang() const override;
    std::string source_filename(const std::string &code) const override;
    std::vector<std::string> run_command(const std::filesystem::path &source_file, const std::filesystem::path &build_dir) const override;
    std::string wrap_source(const std::string &code) const override;
};

}  // namespace sandbox
