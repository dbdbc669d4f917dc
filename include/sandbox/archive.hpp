#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace codebox::sandbox {

/**
 * @brief 将 gzip 压缩的 tar 包解压到 dest 文件夹
 *
 * 只接受普通文件和文件夹条目，PAX 扩展头和 GNU 长文件名仅作为元数据使用。
 * 遇到第一个不合法的条目即停止，之前已经写入的文件不会被删除，由调用方清理 dest。
 * 空输入视为空压缩包。
 *
 * @param data 压缩包的内容
 * @param dest 解压的目标文件夹，必须已经存在
 * @throw archive_error gzip 数据损坏、tar 头部校验失败或者数据被截断
 * @throw path_safety_error 条目名是绝对路径、包含 ".." 或者会被解压到 dest 之外
 * @throw unsupported_entry_error 条目是符号链接、硬链接、设备文件等
 */
void extract_archive(const std::string &data, const std::filesystem::path &dest);

/**
 * @brief 将 source 文件夹打包为 gzip 压缩的 tar 包
 *
 * 按文件名顺序遍历 source，不包含 source 本身。被排除的文件夹不会被遍历。
 * 不会跟随符号链接，普通文件和文件夹以外的条目（符号链接、管道等）会被忽略。
 *
 * @param source 要打包的文件夹
 * @param exclude_patterns 排除模式，参见 is_excluded
 * @param size_limit 压缩后的最大字节数，为 0 时不限制
 * @return 压缩包的内容
 * @throw resource_limit_error 压缩包超过 size_limit
 */
std::string create_archive(const std::filesystem::path &source, const std::vector<std::string> &exclude_patterns, size_t size_limit = 0);

}  // namespace codebox::sandbox
