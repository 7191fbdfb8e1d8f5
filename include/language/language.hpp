#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 支持的编程语言，是一个封闭的集合
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    C,
    CPP
};

/**
 * @brief 将语言名称解析为 language，不区分大小写
 * @return 不支持的语言返回空值
 */
std::optional<language> parse_language(const std::string &name);

/**
 * @brief 语言的规范名称，比如 "python"、"cpp"
 */
std::string to_string(language lang);

const std::vector<language> &supported_languages();

/**
 * @brief 逗号分隔的支持语言列表，用于错误信息
 */
std::string supported_language_list();

}  // namespace sandbox
