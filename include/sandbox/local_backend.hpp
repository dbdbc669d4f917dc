#pragma once

#include "sandbox/backend.hpp"

namespace codebox::sandbox {

/**
 * @brief 直接在宿主机上执行代码，不提供网络和内存隔离
 * 仅用于开发调试，需要在配置中设置 enable_local_backend
 */
struct local_backend : public backend {
    local_backend(const sandbox_config &config, std::shared_ptr<process_runner> runner);

    std::string name() const override;
    bool isolated() const override;
    invocation prepare(const std::filesystem::path &workdir, const language_config &lang, const resource_limits &limits) const override;
};

}  // namespace codebox::sandbox
