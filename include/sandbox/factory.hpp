#pragma once

#include <memory>
#include "sandbox/backend.hpp"

namespace codebox::sandbox {

/**
 * @brief 根据配置创建执行后端
 * @throw configuration_error 后端名称不合法，或者未允许使用 local 后端
 */
std::shared_ptr<backend> create_backend(const sandbox_config &config, std::shared_ptr<process_runner> runner);

}  // namespace codebox::sandbox
