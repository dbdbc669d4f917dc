#pragma once

#include <sys/types.h>
#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @param path 文件路径，父文件夹必须存在
 * @param content 文件内容
 * @param mode 新建文件的权限
 */
void write_file_content(const std::filesystem::path &path, const std::string &content, mode_t mode = 0644);

/**
 * @brief 判断 path 在词法上是否位于 base 文件夹内（或者就是 base 本身）
 * 这里只做词法检查，不会解析符号链接，调用方需要保证路径中不存在符号链接。
 * 用于确保计算目录时不会出现目录遍历攻击。
 */
bool is_inside_directory(const std::filesystem::path &base, const std::filesystem::path &path);

}  // namespace codebox
