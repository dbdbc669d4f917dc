#pragma once

#include <istream>
#include <ostream>
#include "config.hpp"
#include "sandbox/executor.hpp"

namespace codebox::server {

/**
 * @brief 以 MCP（JSON-RPC 2.0）协议逐行读取消息并返回响应
 *
 * 支持 initialize、ping、tools/list 和 tools/call，通知不产生任何输出。
 * 读取消息的线程只负责将消息放入队列，队列最多容纳 config.server.workers 条消息，
 * 队列已满时读取线程阻塞。config.server.workers 个 worker 线程
 * 各自独立地完成消息的解析、执行和响应。响应按完成顺序输出，每个响应占一行。
 * 输入结束或者 stop_server 被调用后不再读取新的消息，
 * 等待队列中已有的消息全部处理完毕后返回。
 *
 * @param config 静态配置
 * @param exec 执行器，被所有 worker 共享
 * @param in 请求流，一般为标准输入
 * @param out 响应流，一般为标准输出
 */
void serve(const configuration &config, const sandbox::executor &exec, std::istream &in, std::ostream &out);

/**
 * @brief 请求停止读取新的请求，可以在信号处理函数中调用
 */
void stop_server();

}  // namespace codebox::server
