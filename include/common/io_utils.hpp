#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 为一次执行创建独占的工作文件夹
 * 文件夹名称为 prefix + 随机生成的 uuid，不同的执行请求永远不会共享同一个文件夹，
 * 避免不相关的执行之间泄露信息。
 * @param root 工作文件夹的父文件夹
 * @return 新建的文件夹路径
 */
std::filesystem::path make_run_directory(const std::filesystem::path &root, const std::string &prefix);

/**
 * @brief 递归删除文件夹，失败时只记录日志而不抛出异常
 * 供清理代码（析构函数、defer）使用。
 */
void remove_directory(const std::filesystem::path &dir) noexcept;

}  // namespace sandbox
