#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codebox {

struct codebox_exception : std::exception {
    codebox_exception();
    explicit codebox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const codebox_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 错误的分类名，前端会将其作为 error_type 返回给调用方
     */
    virtual const char *category() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示调用方的请求不合法
 * 在调用执行后端之前就会被检测出来，比如语言不存在、压缩包损坏等
 */
struct input_error : public codebox_exception {
    using codebox_exception::codebox_exception;
    const char *category() const noexcept override;
};

/**
 * @brief 表示压缩包无法解析（gzip 损坏、tar 头部校验和错误、数据被截断）
 */
struct archive_error : public input_error {
    using input_error::input_error;
};

/**
 * @brief 表示压缩包中的条目会被解压到工作目录之外
 * 比如包含 ".." 路径段，或者是绝对路径
 */
struct path_safety_error : public input_error {
    using input_error::input_error;
};

/**
 * @brief 表示压缩包中存在不允许的条目类型，比如符号链接、设备文件
 */
struct unsupported_entry_error : public input_error {
    using input_error::input_error;
};

/**
 * @brief 表示请求的语言不受支持
 */
struct language_error : public input_error {
    using input_error::input_error;
};

/**
 * @brief 表示执行产物超出了配置的大小限制
 */
struct resource_limit_error : public codebox_exception {
    using codebox_exception::codebox_exception;
    const char *category() const noexcept override;
};

/**
 * @brief 表示执行后端本身出错
 * 一般是容器运行时不存在、无法创建子进程，说明运行环境配置有误，与用户代码无关
 */
struct backend_error : public codebox_exception {
    using codebox_exception::codebox_exception;
    const char *category() const noexcept override;
};

/**
 * @brief 表示静态配置不合法
 */
struct configuration_error : public codebox_exception {
    using codebox_exception::codebox_exception;
    const char *category() const noexcept override;
};

}  // namespace codebox
