#pragma once

#include <string>

namespace codebox {

/**
 * @brief 标准 base64 编码（RFC 4648，带 '=' 填充）
 */
std::string base64_encode(const std::string &data);

/**
 * @brief 标准 base64 解码，允许夹杂空白字符
 * @throw std::invalid_argument 输入不是合法的 base64 文本
 */
std::string base64_decode(const std::string &text);

}  // namespace codebox
