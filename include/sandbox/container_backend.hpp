#pragma once

#include "sandbox/backend.hpp"

namespace codebox::sandbox {

/**
 * @brief 通过容器运行时（docker 或 podman）执行代码
 *
 * 工作目录挂载到容器的 /workdir，容器以 nobody 身份运行，丢弃所有 capability，
 * 默认不允许访问网络。容器名带有随机后缀，并发的请求不会冲突。
 * 超时后通过 rm -f 删除容器。
 */
struct container_backend : public backend {
    /**
     * @param runtime 容器运行时的名称，docker 或 podman
     */
    container_backend(const std::string &runtime, const sandbox_config &config, std::shared_ptr<process_runner> runner);

    std::string name() const override;
    bool isolated() const override;
    invocation prepare(const std::filesystem::path &workdir, const language_config &lang, const resource_limits &limits) const override;

protected:
    void on_timeout(const invocation &inv) override;

private:
    /**
     * @brief 容器运行时的可执行文件，配置了 runtime_path 时使用该路径
     */
    std::string runtime_binary() const;

    std::string runtime;
};

}  // namespace codebox::sandbox
