#include "sandbox/factory.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "sandbox/container_backend.hpp"
#include "sandbox/local_backend.hpp"

namespace codebox::sandbox {
using namespace std;

shared_ptr<backend> create_backend(const sandbox_config &config, shared_ptr<process_runner> runner) {
    if (config.backend == "docker" || config.backend == "podman")
        return make_shared<container_backend>(config.backend, config, move(runner));

    if (config.backend == "local") {
        if (!config.enable_local_backend)
            throw configuration_error("local backend provides no isolation and requires sandbox.enable_local_backend");
        LOG(WARNING) << "Using local backend, submitted code runs on the host WITHOUT isolation";
        return make_shared<local_backend>(config, move(runner));
    }

    throw configuration_error("unsupported backend: " + config.backend);
}

}  // namespace codebox::sandbox
