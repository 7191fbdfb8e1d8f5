#pragma once

#include <boost/regex.hpp>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "language/language.hpp"

namespace sandbox {

/**
 * @brief 静态检查发现的危险代码
 */
struct security_finding {
    /**
     * @brief 危险代码的类别，比如 blocked_import、process_exec
     */
    std::string pattern;

    /**
     * @brief 给用户看的拒绝原因
     */
    std::string message;

    /**
     * @brief 源代码中匹配到的片段
     */
    std::string matched_text;
};

struct sanitize_result {
    bool ok = true;
    std::optional<security_finding> finding;
};

/**
 * @brief 一条危险代码的匹配规则
 */
struct security_pattern {
    std::string category;
    std::string message;
    boost::regex matcher;

    security_pattern(const std::string &category, const std::string &message, const std::string &expression);
};

/**
 * @brief 获得某个语言的危险代码规则表
 * 规则表在第一次使用时构建，之后只读，可以被多个线程同时使用。
 * 规则按顺序匹配，排在前面的规则优先。
 */
const std::vector<security_pattern> &security_patterns(language lang);

/**
 * @brief 在执行之前静态检查源代码
 * 1. 源代码超过 max_source_bytes 字节时拒绝
 * 2. 源代码不是合法的 UTF-8 时拒绝
 * 3. 按顺序用该语言的规则表（不区分大小写）匹配源代码，返回第一条匹配的规则
 * 4. 某条规则的匹配超出了正则引擎的复杂度上限时，无法确认代码安全，同样拒绝
 *
 * 无论之后使用容器还是子进程执行，所有请求都必须先通过这里的检查。
 * 该函数没有副作用。
 *
 * @param code 用户提交的源代码
 * @param lang 源代码的语言
 * @param max_source_bytes 源代码的最大字节数
 */
sanitize_result sanitize(const std::string &code, language lang, std::size_t max_source_bytes = MAX_SOURCE_BYTES);

}  // namespace sandbox
