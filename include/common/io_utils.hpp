#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace hindsight {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw io_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件开头至多 limit 个字节
 * 用于截取选手程序的标准输出和标准错误流，文件不存在时返回空串
 * @param truncated 若文件长度超过 limit，置为 true
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit, bool &truncated);

/**
 * @brief 覆盖写入文件，写入失败时抛出 io_error（比如磁盘已满）
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 测试点编号会被用于拼接输出文件名，而评测时需要 root 权限，
 * 如果文件名包含 "../"，有可能导致系统重要文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 判断 path 是否位于目录 dir 之内
 * 两个路径都会先被规范化
 */
bool is_under_directory(const std::filesystem::path &path, const std::filesystem::path &dir);

/**
 * @brief 将路径表示为相对于 dir 的路径，若不在 dir 内则只保留文件名
 */
std::string display_path(const std::filesystem::path &path, const std::filesystem::path &dir);

}  // namespace hindsight
