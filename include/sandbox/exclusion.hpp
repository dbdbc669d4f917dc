#pragma once

#include <string>
#include <vector>

namespace codebox::sandbox {

/**
 * @brief 判断工作目录中的路径是否应该从产物压缩包中排除
 *
 * 以 '/' 结尾的模式是目录模式，路径本身、路径的任意一级目录与其同名时排除，
 * 比如 "node_modules/" 同时排除 node_modules/x.js 和 frontend/node_modules/x.js；
 * 其他模式是通配符模式，与路径的文件名或完整相对路径匹配时排除，
 * 通配符中的 * 和 ? 不会匹配 '/'，格式错误的通配符视为不匹配。
 *
 * 若模式不含通配符且与常见目录名同名（比如 build），则不会排除与之完全相同的路径，
 * 需要排除该目录时请使用目录模式 "build/"。
 *
 * 该函数不访问文件系统，结果与模式的顺序无关。
 * @param relative_path 相对于工作目录的路径，使用 '/' 分隔，不以 '/' 开头
 * @param patterns 排除模式列表，为空时不排除任何路径
 */
bool is_excluded(const std::string &relative_path, const std::vector<std::string> &patterns);

/**
 * @brief 是否为常见的目录名，比如 node_modules, .git, build
 */
bool is_common_directory_name(const std::string &name);

}  // namespace codebox::sandbox
