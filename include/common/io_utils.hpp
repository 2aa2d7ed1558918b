#pragma once

#include <filesystem>
#include <string>

namespace safeexec {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 完整写入文件，文件已存在时覆盖
 * @throw std::system_error 文件无法打开或写入不完整（比如磁盘已满）
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 统计 UTF-8 字符串中的字符（码位）个数
 * 调用方需要先确保 string 是合法的 UTF-8 字符串
 */
size_t utf8_length(const std::string &string);

/**
 * @brief 断言 subpath 是单层的文件名
 * 这里用于确保计算路径时不会出现目录遍历攻击
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 查找文件夹内有多少个子文件夹（不递归统计）
 * @param dir 要被统计的文件夹
 * @return 文件夹内的子文件夹数量，文件夹不存在时返回 -1
 */
int count_directories_in_directory(const std::filesystem::path &dir);

}  // namespace safeexec
