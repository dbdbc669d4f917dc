#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/backend.hpp"
#include "sandbox/language.hpp"

namespace codebox::sandbox {

/**
 * @brief 一次执行的状态
 *
 * CREATED → WORKSPACE_PREPARED → CODE_WRITTEN → BACKEND_INVOKED → COMPLETED | TIMED_OUT
 * 任何一步出错都会直接进入 FAILED
 */
enum class execution_state {
    CREATED,
    WORKSPACE_PREPARED,
    CODE_WRITTEN,
    BACKEND_INVOKED,
    COMPLETED,
    TIMED_OUT,
    FAILED
};

std::string to_string(execution_state state);

std::ostream &operator<<(std::ostream &os, execution_state state);

struct execution_request {
    /**
     * @brief 请求的标识，只用于日志
     */
    std::string id;

    language lang = language::PYTHON;

    /**
     * @brief 用户代码
     */
    std::string code;

    /**
     * @brief 工作目录的初始内容，gzip 压缩的 tar 包，可以为空
     */
    std::string workdir_archive;

    /**
     * @brief 请求指定的资源限制，只能比配置的限制更严格
     */
    std::optional<int> timeout_sec;
    std::optional<int> memory_mb;
    std::optional<bool> network_enabled;
};

struct execution_result {
    std::string out;
    std::string err;
    int exitcode = 0;

    /**
     * @brief 执行后工作目录的 gzip 压缩 tar 包，超时时为空
     */
    std::string artifacts;

    bool timed_out = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 执行器，负责一次请求的完整流程
 *
 * 1. 创建独占的临时工作目录，解压请求中的压缩包
 * 2. 拼接语言的前后缀代码，写入源文件
 * 3. 调用执行后端
 * 4. 若未超时，将工作目录打包为产物压缩包
 *
 * 无论以何种方式结束，临时工作目录都会被删除。
 * execute 不修改执行器的状态，可以在多个线程中同时调用；
 * on_state_changed 需要在开始执行之前调用。
 */
struct executor {
    using state_callback = std::function<void(const execution_request &, execution_state)>;

    executor(const configuration &config, std::shared_ptr<backend> exec_backend);

    /**
     * @brief 执行请求
     * 程序返回非 0 值和超时都会正常返回结果
     * @throw input_error 请求不合法，比如语言不受支持、压缩包损坏或者包含不安全的路径
     * @throw resource_limit_error 产物压缩包超过大小限制
     * @throw backend_error 无法调用执行后端
     * @throw configuration_error 不允许使用当前的执行后端
     */
    execution_result execute(const execution_request &request) const;

    /**
     * @brief 注册状态变化回调，每次状态变化时按注册顺序调用
     */
    void on_state_changed(state_callback callback);

    /**
     * @brief 计算请求实际使用的资源限制
     * @throw input_error 请求中的限制不合法
     */
    resource_limits resolve_limits(const execution_request &request) const;

private:
    void transit(const execution_request &request, execution_state state) const;

    const configuration &config;
    std::shared_ptr<backend> exec_backend;
    std::vector<state_callback> callbacks;
};

}  // namespace codebox::sandbox
