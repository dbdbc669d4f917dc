#include "sandbox/container_backend.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include "common/utils.hpp"

namespace codebox::sandbox {
using namespace std;

static const char *CONTAINER_WORKDIR = "/workdir";

container_backend::container_backend(const string &runtime, const sandbox_config &config, shared_ptr<process_runner> runner)
    : backend(config, move(runner)), runtime(runtime) {}

string container_backend::name() const {
    return runtime;
}

bool container_backend::isolated() const {
    return true;
}

string container_backend::runtime_binary() const {
    return config.runtime_path.empty() ? runtime : config.runtime_path;
}

invocation container_backend::prepare(const filesystem::path &workdir, const language_config &lang, const resource_limits &limits) const {
    invocation inv;
    inv.name = "codebox-exec-" + random_uuid();

    // 交换分区与内存使用相同的限制，即不允许使用交换分区
    string memory = fmt::format("{}m", limits.memory_mb);
    to_string_list(inv.argv,
                   runtime_binary(), "run",
                   "--name", inv.name,
                   "--rm",
                   "-v", fmt::format("{}:{}", workdir, CONTAINER_WORKDIR),
                   "--workdir", CONTAINER_WORKDIR,
                   "--memory", memory,
                   "--memory-swap", memory,
                   "--network", limits.network_enabled ? "bridge" : "none",
                   "--pids-limit", config.pids_limit,
                   "--ulimit", fmt::format("fsize={}", config.file_size_limit_bytes),
                   "--ulimit", fmt::format("cpu={}", limits.timeout.count()),
                   "--security-opt", "no-new-privileges:true",
                   "--user", "nobody",
                   "--cap-drop", "ALL");

    for (auto &[key, value] : lang.environment)
        to_string_list(inv.argv, "-e", key + "=" + value);

    to_string_list(inv.argv, lang.image, "sh", "-c", lang.shell_command());
    return inv;
}

void container_backend::on_timeout(const invocation &inv) {
    // 运行时客户端被杀死后容器可能仍在运行
    process_options options;
    to_string_list(options.argv, runtime_binary(), "rm", "-f", inv.name);
    options.timeout = chrono::seconds(config.stop_grace_sec);
    options.output_limit = 4096;

    try {
        process_result result = runner->run(options);
        if (result.timed_out)
            LOG(ERROR) << "[" << inv.name << "] " << runtime << " rm did not finish within " << config.stop_grace_sec << "s";
        else if (result.exitcode != 0)
            LOG(ERROR) << "[" << inv.name << "] " << runtime << " rm failed with exit code " << result.exitcode << ": " << result.err;
        else
            VLOG(1) << "[" << inv.name << "] container removed";
    } catch (system_error &e) {
        LOG(ERROR) << "[" << inv.name << "] unable to remove container: " << e.what();
    }
}

}  // namespace codebox::sandbox
