#include "sandbox/backend.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codebox::sandbox {
using namespace std;

backend::backend(const sandbox_config &config, shared_ptr<process_runner> runner)
    : config(config), runner(move(runner)) {}

backend::~backend() = default;

backend_result backend::run(const filesystem::path &workdir, const language_config &lang, const resource_limits &limits) {
    invocation inv = prepare(workdir, lang, limits);
    if (inv.argv.empty())
        throw backend_error(name() + " backend produced an empty command");

    process_options options;
    options.argv = inv.argv;
    options.env = inv.env;
    options.inherit_env = inv.inherit_env;
    options.workdir = inv.workdir;
    options.timeout = limits.timeout;
    options.output_limit = config.max_output_bytes;

    VLOG(1) << "[" << inv.name << "] " << format_command(inv.argv);

    process_result proc;
    try {
        proc = runner->run(options);
    } catch (system_error &e) {
        throw backend_error(fmt::format("{} backend is unable to start {}: {}", name(), inv.argv.front(), e.what()));
    }

    if (proc.out_truncated || proc.err_truncated)
        LOG(WARNING) << "[" << inv.name << "] output exceeds " << config.max_output_bytes << " bytes and has been truncated";

    backend_result result;
    result.out = move(proc.out);
    result.err = move(proc.err);
    result.exitcode = proc.exitcode;
    result.wall_time = proc.wall_time;

    if (proc.timed_out) {
        LOG(WARNING) << "[" << inv.name << "] execution timed out after " << limits.timeout.count() << "s";
        on_timeout(inv);
        result.timed_out = true;
        result.exitcode = E_TIMEOUT;
        result.err += "\nExecution timed out";
    }
    return result;
}

void backend::on_timeout(const invocation &) {}

}  // namespace codebox::sandbox
