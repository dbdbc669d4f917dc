#include "server/server.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <pthread.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "server/protocol.hpp"

namespace codebox::server {
using namespace std;
using namespace nlohmann;

// 停止读取请求的标记
static volatile sig_atomic_t stop_requested = 0;

void stop_server() {
    stop_requested = 1;
}

static json call_tool(const sandbox::executor &exec, const rpc_message &msg) {
    if (!msg.params.is_object() || !msg.params.count("name") || !msg.params.at("name").is_string())
        throw rpc_error(INVALID_PARAMS, "tools/call requires a tool name");
    string name = msg.params.at("name").get<string>();
    if (name != TOOL_NAME)
        throw rpc_error(INVALID_PARAMS, "unknown tool: " + name);

    sandbox::execution_request req;
    req.id = msg.id.is_string() ? msg.id.get<string>() : msg.id.dump();
    tool_response res;
    try {
        parse_arguments(msg.params.count("arguments") ? msg.params.at("arguments") : json::object(), req);
        res = make_tool_response(exec.execute(req));
    } catch (codebox_exception &ex) {
        LOG(WARNING) << "Request " << req.id << " failed with " << ex.category() << " error: " << ex.what();
        res = make_tool_error(ex);
    } catch (exception &ex) {
        LOG(ERROR) << "Request " << req.id << " crashed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        res = make_tool_error(ex);
    }
    return tool_call_result(res);
}

static json dispatch(const sandbox::executor &exec, const rpc_message &msg) {
    if (msg.method == "initialize")
        return initialize_result(msg.params);
    if (msg.method == "ping")
        return json::object();
    if (msg.method == "tools/list")
        return tools_list_result();
    if (msg.method == "tools/call")
        return call_tool(exec, msg);
    if (boost::starts_with(msg.method, "notifications/"))
        return json::object();
    throw rpc_error(METHOD_NOT_FOUND, "method not found: " + msg.method);
}

/**
 * @brief 处理一条消息
 * @return 需要输出的响应，通知没有响应
 */
static optional<string> handle_message(const sandbox::executor &exec, const string &line) {
    rpc_message msg;
    try {
        parse_message(line, msg);
        VLOG(1) << "Received " << msg.method << " " << msg.id.dump();
        json result = dispatch(exec, msg);
        if (msg.notification) return nullopt;
        return serialize_result(msg.id, result);
    } catch (rpc_error &ex) {
        LOG(WARNING) << "Rejected message " << msg.id.dump() << ": " << ex.what();
        if (msg.notification) return nullopt;
        return serialize_error(msg.id, ex.code, ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "Message " << msg.id.dump() << " crashed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        if (msg.notification) return nullopt;
        return serialize_error(msg.id, INTERNAL_ERROR, ex.what());
    }
}

static void worker_loop(int worker_id, const sandbox::executor &exec, concurrent_queue<string> &requests, ostream &out, mutex &out_mutex) {
    VLOG(1) << "Worker " << worker_id << " started";

    string line;
    while (requests.pop(line)) {
        optional<string> response = handle_message(exec, line);
        if (!response) continue;

        scoped_lock guard(out_mutex);
        out << *response << endl;
    }

    VLOG(1) << "Worker " << worker_id << " stopped";
}

void serve(const configuration &config, const sandbox::executor &exec, istream &in, ostream &out) {
    stop_requested = 0;

    // 队列已满时读取线程阻塞，不再继续读取输入
    concurrent_queue<string> requests(config.server.workers);
    mutex out_mutex;
    vector<thread> workers;

    {
        // worker 线程屏蔽 SIGINT 和 SIGTERM，使信号由读取请求的线程处理并打断阻塞的读取
        sigset_t mask, old_mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &mask, &old_mask);
        for (int i = 0; i < config.server.workers; ++i)
            workers.emplace_back(worker_loop, i, cref(exec), ref(requests), ref(out), ref(out_mutex));
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    }
    LOG(INFO) << "Serving requests with " << workers.size() << " workers";

    string line;
    while (!stop_requested && getline(in, line)) {
        boost::trim(line);
        if (line.empty()) continue;
        requests.push(move(line));
    }

    if (stop_requested)
        LOG(INFO) << "Stop requested, waiting for pending requests";
    else
        LOG(INFO) << "End of input, waiting for pending requests";

    requests.close();
    for (auto &worker : workers) worker.join();
}

}  // namespace codebox::server
