#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/process.hpp"
#include "config.hpp"
#include "sandbox/language.hpp"

namespace codebox::sandbox {

/**
 * @brief 一次执行的资源限制
 */
struct resource_limits {
    /**
     * @brief 时钟时间限制
     */
    std::chrono::seconds timeout{10};

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_mb = 512;

    /**
     * @brief 是否允许访问网络
     */
    bool network_enabled = false;
};

/**
 * @brief 后端调用的完整描述
 * 由后端根据工作目录、语言配置和资源限制生成，执行器不关心其内容
 */
struct invocation {
    /**
     * @brief 本次调用的唯一标识，容器后端为容器名
     */
    std::string name;

    std::vector<std::string> argv;

    /**
     * @brief 外部程序的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 外部程序是否继承当前进程的环境变量
     */
    bool inherit_env = true;

    /**
     * @brief 外部程序的工作路径
     */
    std::filesystem::path workdir;
};

struct backend_result {
    std::string out;
    std::string err;

    /**
     * @brief 程序的返回值，超时时为 E_TIMEOUT
     */
    int exitcode = 0;

    bool timed_out = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 执行后端
 * 负责在工作目录中编译运行用户代码，并在超时后强制终止程序
 */
struct backend {
    backend(const sandbox_config &config, std::shared_ptr<process_runner> runner);
    virtual ~backend();

    /**
     * @brief 后端的名称，比如 docker
     */
    virtual std::string name() const = 0;

    /**
     * @brief 后端是否提供隔离
     * 不提供隔离的后端只有在配置中显式允许时才能使用
     */
    virtual bool isolated() const = 0;

    /**
     * @brief 构造调用描述，每次调用都会生成新的唯一标识
     * @param workdir 工作目录，用户代码已经写入其中
     * @param lang 语言配置
     * @param limits 资源限制
     */
    virtual invocation prepare(const std::filesystem::path &workdir, const language_config &lang, const resource_limits &limits) const = 0;

    /**
     * @brief 在工作目录中执行用户代码
     * 程序返回非 0 值不是错误。超时时强制终止程序，返回 timed_out 为真的结果，
     * 并在 stderr 末尾追加超时提示。
     * @throw backend_error 无法启动外部程序，比如容器运行时不存在
     */
    backend_result run(const std::filesystem::path &workdir, const language_config &lang, const resource_limits &limits);

protected:
    /**
     * @brief 超时后清理残留的执行环境，比如删除容器
     * 失败时只记录日志，不影响超时结果
     */
    virtual void on_timeout(const invocation &inv);

    const sandbox_config &config;
    std::shared_ptr<process_runner> runner;
};

}  // namespace codebox::sandbox
