#include "sandbox/local_backend.hpp"
#include "common/utils.hpp"

namespace codebox::sandbox {
using namespace std;

static const char *DEFAULT_PATH = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

local_backend::local_backend(const sandbox_config &config, shared_ptr<process_runner> runner)
    : backend(config, move(runner)) {}

string local_backend::name() const {
    return "local";
}

bool local_backend::isolated() const {
    return false;
}

invocation local_backend::prepare(const filesystem::path &workdir, const language_config &lang, const resource_limits &) const {
    invocation inv;
    inv.name = "codebox-local-" + random_uuid();
    to_string_list(inv.argv, "sh", "-c", lang.shell_command());
    inv.workdir = workdir;

    // 只保留最基本的环境变量，避免泄露宿主机的环境
    inv.inherit_env = false;
    inv.env["PATH"] = get_env("PATH", DEFAULT_PATH);
    inv.env["HOME"] = workdir.string();
    inv.env["TMPDIR"] = workdir.string();
    for (auto &[key, value] : lang.environment)
        inv.env[key] = value;
    return inv;
}

}  // namespace codebox::sandbox
