#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace sandbox {

template <typename T>
struct to_string_cont {
    template <typename ContainerT, typename U>
    static void to_string(ContainerT &cont, const U &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表 (argv)
 * 参数列表直接交给 execvp 执行，不经过 shell 解释，因此不存在转义和注入问题。
 * @code{.cpp}
 *     std::filesystem::path source("/tmp/run/solution.c");
 *     // {"gcc", "/tmp/run/solution.c", "-o", "/tmp/run/solution"}
 *     auto argv = make_command("gcc", source, "-o", source.parent_path() / "solution");
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_command(const Args &... args) {
    std::vector<std::string> list;
    if constexpr (sizeof...(args) > 0)
        to_string_list(list, args...);
    return list;
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在或为空，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 读取数值类型的环境变量
 * @throw std::invalid_argument 环境变量存在但不能解析为 T
 */
template <typename T>
T get_env_value(const std::string &key, const T &def_value) {
    std::string value = get_env(key, "");
    if (value.empty()) return def_value;
    try {
        return boost::lexical_cast<T>(value);
    } catch (boost::bad_lexical_cast &) {
        throw std::invalid_argument("environment variable " + key + " has invalid value " + value);
    }
}

/**
 * @brief 去掉字符串首尾的空白字符
 */
std::string trim_copy(const std::string &str);

/**
 * @brief UTF-8 字符串中的字符（码位）个数
 */
std::size_t utf8_length(const std::string &str);

/**
 * @brief 将字符串截断到至多 max_chars 个字符
 * 按 UTF-8 码位计数，截断时不会把一个多字节字符切成两半。
 */
std::string truncate_utf8(const std::string &str, std::size_t max_chars);

/**
 * @brief 在 PATH 中查找可执行文件
 * @return 是否能找到 name 对应的可执行文件
 */
bool program_exists(const std::string &name);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
