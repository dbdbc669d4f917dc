#include "server/protocol.hpp"
#include <algorithm>
#include <stdexcept>
#include "common/base64.hpp"
#include "sandbox/language.hpp"

namespace codebox::server {
using namespace std;
using namespace nlohmann;

const char *const SERVER_NAME = "codebox-executor";
const char *const SERVER_VERSION = "1.0.0";
const char *const TOOL_NAME = "execute_sandboxed_code";
const char *const LATEST_PROTOCOL_VERSION = "2025-06-18";

static const char *const SUPPORTED_PROTOCOL_VERSIONS[] = {"2024-11-05", "2025-03-26", "2025-06-18"};

rpc_error::rpc_error(int code, const string &message)
    : codebox_exception(message), code(code) {}

void parse_message(const string &line, rpc_message &msg) {
    json j;
    try {
        j = json::parse(line);
    } catch (json::parse_error &e) {
        throw rpc_error(PARSE_ERROR, string("message is not valid JSON: ") + e.what());
    }

    if (!j.is_object())
        throw rpc_error(INVALID_REQUEST, "message must be a JSON object");

    msg.notification = !j.count("id");
    if (!msg.notification) {
        const json &id = j.at("id");
        if (!id.is_string() && !id.is_number_integer() && !id.is_null())
            throw rpc_error(INVALID_REQUEST, "id must be a string or an integer");
        msg.id = id;
    }

    if (!j.count("jsonrpc") || j.at("jsonrpc") != "2.0")
        throw rpc_error(INVALID_REQUEST, "jsonrpc must be \"2.0\"");

    if (!j.count("method")) {
        // 客户端发来的响应，服务器从不发起请求，不需要回应
        if (j.count("result") || j.count("error")) msg.notification = true;
        throw rpc_error(INVALID_REQUEST, "message has no method");
    }
    if (!j.at("method").is_string())
        throw rpc_error(INVALID_REQUEST, "method must be a string");
    msg.method = j.at("method").get<string>();

    if (j.count("params")) {
        msg.params = j.at("params");
        if (!msg.params.is_object() && !msg.params.is_array())
            throw rpc_error(INVALID_REQUEST, "params must be an object or an array");
    }
}

template <typename T>
static T get_field(const json &j, const char *key) {
    try {
        return j.at(key).get<T>();
    } catch (json::exception &e) {
        throw input_error(string("invalid field ") + key + ": " + e.what());
    }
}

void parse_arguments(const json &arguments, sandbox::execution_request &req) {
    if (!arguments.is_object())
        throw input_error("tool arguments must be a JSON object");

    req.lang = sandbox::parse_language(get_field<string>(arguments, "language"));
    req.code = get_field<string>(arguments, "code");

    // 空字符串与不提供 workdir_tar 等价
    if (arguments.count("workdir_tar") && !arguments.at("workdir_tar").is_null()) {
        try {
            req.workdir_archive = base64_decode(get_field<string>(arguments, "workdir_tar"));
        } catch (invalid_argument &e) {
            throw input_error(string("workdir_tar is not valid base64: ") + e.what());
        }
    }
    if (arguments.count("timeout_sec"))
        req.timeout_sec = get_field<int>(arguments, "timeout_sec");
    if (arguments.count("memory_mb"))
        req.memory_mb = get_field<int>(arguments, "memory_mb");
    if (arguments.count("network"))
        req.network_enabled = get_field<bool>(arguments, "network");
}

void to_json(json &j, const tool_response &res) {
    j = json{{"success", res.success}};
    if (res.success) {
        j["stdout"] = res.out;
        j["stderr"] = res.err;
        j["exit_code"] = res.exitcode;
        if (!res.artifacts.empty())
            j["artifacts_tar"] = base64_encode(res.artifacts);
        j["timed_out"] = res.timed_out;
    } else {
        j["stdout"] = "";
        j["stderr"] = "";
        j["exit_code"] = 1;
        j["error"] = res.error;
        j["error_type"] = res.error_type;
    }
}

tool_response make_tool_response(const sandbox::execution_result &result) {
    tool_response res;
    res.success = true;
    res.out = result.out;
    res.err = result.err;
    res.exitcode = result.exitcode;
    res.artifacts = result.artifacts;
    res.timed_out = result.timed_out;
    return res;
}

tool_response make_tool_error(const exception &ex) {
    tool_response res;
    res.success = false;
    res.error = ex.what();
    if (auto e = dynamic_cast<const codebox_exception *>(&ex))
        res.error_type = e->category();
    else
        res.error_type = "internal";
    return res;
}

json initialize_result(const json &params) {
    string version = LATEST_PROTOCOL_VERSION;
    if (params.is_object() && params.count("protocolVersion") && params.at("protocolVersion").is_string()) {
        string requested = params.at("protocolVersion").get<string>();
        if (find(begin(SUPPORTED_PROTOCOL_VERSIONS), end(SUPPORTED_PROTOCOL_VERSIONS), requested) != end(SUPPORTED_PROTOCOL_VERSIONS))
            version = requested;
    }

    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}}}};
}

static json input_schema() {
    json languages = json::array();
    for (sandbox::language lang : sandbox::supported_languages())
        languages.push_back(sandbox::to_string(lang));

    return {
        {"type", "object"},
        {"properties", {
            {"code", {{"type", "string"}, {"description", "The source code to execute"}}},
            {"language", {{"type", "string"}, {"enum", languages}, {"description", "The programming language of the code"}}},
            {"workdir_tar", {{"type", "string"}, {"description", "Optional base64 encoded tar.gz archive extracted into the working directory before execution"}}},
            {"timeout_sec", {{"type", "integer"}, {"description", "Optional wall clock limit in seconds, capped by the server configuration"}}},
            {"memory_mb", {{"type", "integer"}, {"description", "Optional memory limit in MiB, capped by the server configuration"}}},
            {"network", {{"type", "boolean"}, {"description", "Optional network access, only honored when the server allows it"}}}}},
        {"required", json::array({"code", "language"})}};
}

static json output_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"stdout", {{"type", "string"}}},
            {"stderr", {{"type", "string"}}},
            {"exit_code", {{"type", "integer"}}},
            {"artifacts_tar", {{"type", "string"}, {"description", "Base64 encoded tar.gz archive of the working directory after execution"}}},
            {"timed_out", {{"type", "boolean"}}},
            {"success", {{"type", "boolean"}}},
            {"error", {{"type", "string"}}},
            {"error_type", {{"type", "string"}}}}},
        {"required", json::array({"stdout", "stderr", "exit_code", "success"})}};
}

json tools_list_result() {
    json tool = {
        {"name", TOOL_NAME},
        {"description", "Execute untrusted code in a sandboxed environment"},
        {"inputSchema", input_schema()},
        {"outputSchema", output_schema()}};
    return {{"tools", json::array({tool})}};
}

json tool_call_result(const tool_response &res) {
    json structured = res;
    json text = {{"type", "text"}, {"text", structured.dump(-1, ' ', false, json::error_handler_t::replace)}};
    return {
        {"content", json::array({text})},
        {"structuredContent", structured},
        {"isError", false}};
}

string serialize_result(const json &id, const json &result) {
    json j = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

string serialize_error(const json &id, int code, const string &message) {
    json j = {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace codebox::server
