#include "sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/archive.hpp"
#include "sandbox/workspace.hpp"

namespace codebox::sandbox {
using namespace std;

string to_string(execution_state state) {
    switch (state) {
        case execution_state::CREATED:
            return "created";
        case execution_state::WORKSPACE_PREPARED:
            return "workspace_prepared";
        case execution_state::CODE_WRITTEN:
            return "code_written";
        case execution_state::BACKEND_INVOKED:
            return "backend_invoked";
        case execution_state::COMPLETED:
            return "completed";
        case execution_state::TIMED_OUT:
            return "timed_out";
        case execution_state::FAILED:
            return "failed";
    }
    return "unknown";
}

ostream &operator<<(ostream &os, execution_state state) {
    return os << to_string(state);
}

executor::executor(const configuration &config, shared_ptr<backend> exec_backend)
    : config(config), exec_backend(move(exec_backend)) {}

void executor::on_state_changed(state_callback callback) {
    callbacks.push_back(move(callback));
}

void executor::transit(const execution_request &request, execution_state state) const {
    LOG(INFO) << "Execution " << request.id << " (" << request.lang << ") " << state;
    for (auto &callback : callbacks)
        callback(request, state);
}

resource_limits executor::resolve_limits(const execution_request &request) const {
    resource_limits limits;

    int timeout_sec = config.sandbox.timeout_sec;
    if (request.timeout_sec) {
        if (*request.timeout_sec <= 0)
            throw input_error(fmt::format("timeout_sec must be positive, got {}", *request.timeout_sec));
        timeout_sec = min(timeout_sec, *request.timeout_sec);
    }
    limits.timeout = chrono::seconds(timeout_sec);

    limits.memory_mb = config.sandbox.memory_mb;
    if (request.memory_mb) {
        if (*request.memory_mb <= 0)
            throw input_error(fmt::format("memory_mb must be positive, got {}", *request.memory_mb));
        limits.memory_mb = min(limits.memory_mb, *request.memory_mb);
    }

    // 请求只能关闭网络，不能打开配置中关闭的网络
    limits.network_enabled = config.sandbox.network_enabled && request.network_enabled.value_or(true);
    return limits;
}

execution_result executor::execute(const execution_request &request) const {
    transit(request, execution_state::CREATED);

    try {
        if (!exec_backend->isolated() && !config.sandbox.enable_local_backend)
            throw configuration_error(exec_backend->name() + " backend provides no isolation and is not enabled");

        const language_config &lang = config.language(request.lang);
        resource_limits limits = resolve_limits(request);

        workspace ws(config.sandbox.scratch_root());
        extract_archive(request.workdir_archive, ws.path());
        transit(request, execution_state::WORKSPACE_PREPARED);

        write_file_content(ws.path() / lang.file_name, apply_hooks(lang, request.code), 0666);
        transit(request, execution_state::CODE_WRITTEN);

        transit(request, execution_state::BACKEND_INVOKED);
        backend_result output = exec_backend->run(ws.path(), lang, limits);

        execution_result result;
        result.out = move(output.out);
        result.err = move(output.err);
        result.exitcode = output.exitcode;
        result.wall_time = output.wall_time;

        if (output.timed_out) {
            // 程序可能仍未完全退出，不读取工作目录
            result.timed_out = true;
            transit(request, execution_state::TIMED_OUT);
            return result;
        }

        result.artifacts = create_archive(ws.path(), lang.exclude_patterns, config.sandbox.max_artifact_bytes());
        transit(request, execution_state::COMPLETED);
        return result;
    } catch (codebox_exception &e) {
        LOG(WARNING) << "Execution " << request.id << " failed: " << e.what();
        transit(request, execution_state::FAILED);
        throw;
    } catch (exception &e) {
        LOG(ERROR) << "Execution " << request.id << " failed unexpectedly: " << e.what();
        transit(request, execution_state::FAILED);
        throw;
    }
}

}  // namespace codebox::sandbox
