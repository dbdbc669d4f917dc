#pragma once

#include <nlohmann/json.hpp>
#include <exception>
#include <string>
#include "common/exceptions.hpp"
#include "sandbox/executor.hpp"

namespace codebox::server {

extern const char *const SERVER_NAME;
extern const char *const SERVER_VERSION;

/**
 * @brief 对外提供的唯一工具
 */
extern const char *const TOOL_NAME;

/**
 * @brief 客户端未指定或者指定了不支持的版本时使用的 MCP 协议版本
 */
extern const char *const LATEST_PROTOCOL_VERSION;

/**
 * @brief JSON-RPC 2.0 规定的错误码
 */
enum rpc_error_code {
    PARSE_ERROR = -32700,
    INVALID_REQUEST = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS = -32602,
    INTERNAL_ERROR = -32603
};

/**
 * @brief 消息本身不合法，以 JSON-RPC error 对象返回给客户端
 * 工具执行失败不属于此类，工具执行失败时返回 success 为 false 的工具结果
 */
struct rpc_error : public codebox_exception {
    rpc_error(int code, const std::string &message);

    int code;
};

/**
 * @brief 客户端发来的一条 JSON-RPC 消息
 */
struct rpc_message {
    /**
     * @brief 请求的 id，通知或者 id 无法解析时为 null
     */
    nlohmann::json id;

    /**
     * @brief 通知没有 id，服务器不对通知作出任何回应
     */
    bool notification = false;

    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

/**
 * @brief 解析一行 JSON-RPC 消息
 * 消息不合法时 msg.id 和 msg.notification 仍然会被尽可能地填充，以便返回错误响应
 * @throw rpc_error PARSE_ERROR 或者 INVALID_REQUEST
 */
void parse_message(const std::string &line, rpc_message &msg);

/**
 * @brief execute_sandboxed_code 工具的结果，成功时 error 为空，失败时只有 error 和 error_type 有意义
 */
struct tool_response {
    bool success = false;
    std::string out;
    std::string err;
    int exitcode = 0;
    std::string artifacts;
    bool timed_out = false;
    std::string error;

    /**
     * @brief 错误的分类：input, resource_limit, backend, configuration, internal
     */
    std::string error_type;
};

void to_json(nlohmann::json &j, const tool_response &res);

/**
 * @brief 将 tools/call 的 arguments 转换为执行请求
 *
 * @code{.json}
 * {
 *     "language": "python",
 *     "code": "print('hi')",
 *     "workdir_tar": "<base64>",  // 可选
 *     "timeout_sec": 5,           // 可选
 *     "memory_mb": 256,           // 可选
 *     "network": false            // 可选
 * }
 * @endcode
 *
 * @throw input_error 缺少字段、字段类型错误、语言不受支持或者 base64 不合法
 */
void parse_arguments(const nlohmann::json &arguments, sandbox::execution_request &req);

tool_response make_tool_response(const sandbox::execution_result &result);

/**
 * @brief 根据异常构造失败的工具结果，codebox_exception 以外的异常归类为 internal
 */
tool_response make_tool_error(const std::exception &ex);

/**
 * @brief initialize 请求的结果，客户端请求的协议版本受支持时原样使用，否则使用 LATEST_PROTOCOL_VERSION
 */
nlohmann::json initialize_result(const nlohmann::json &params);

/**
 * @brief tools/list 请求的结果，包含工具的输入输出 JSON Schema
 */
nlohmann::json tools_list_result();

/**
 * @brief tools/call 请求的结果，结构化结果同时以文本形式放在 content 中
 */
nlohmann::json tool_call_result(const tool_response &res);

/**
 * @brief 将成功的 JSON-RPC 响应序列化为一行，不合法的 UTF-8 字符会被替换
 */
std::string serialize_result(const nlohmann::json &id, const nlohmann::json &result);

std::string serialize_error(const nlohmann::json &id, int code, const std::string &message);

}  // namespace codebox::server
