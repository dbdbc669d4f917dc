#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <string>
#include "sandbox/language.hpp"

namespace codebox {

enum error_codes {
    E_SUCCESS = 0,

    /**
     * @brief 执行超时时返回给调用方的退出码
     */
    E_TIMEOUT = 1
};

/**
 * @brief 前端的配置
 */
struct server_config {
    /**
     * @brief 与调用方通信的方式，stdio 或者 http
     * 目前只实现了 stdio（每行一条 MCP JSON-RPC 消息），选择 http 会被视为配置错误
     */
    std::string transport = "stdio";

    /**
     * @brief http 方式监听的端口
     */
    int http_port = 8080;

    /**
     * @brief 并发处理请求的 worker 数
     */
    int workers = 1;
};

/**
 * @brief 执行环境的配置
 */
struct sandbox_config {
    /**
     * @brief 执行后端，可选 docker, podman, local
     */
    std::string backend = "docker";

    /**
     * @brief 默认的时钟时间限制，单位为秒
     */
    int timeout_sec = 10;

    /**
     * @brief 默认的内存限制，单位为 MB
     */
    int memory_mb = 512;

    /**
     * @brief 产物压缩包的最大大小，单位为 MB
     */
    int max_artifact_size_mb = 20;

    /**
     * @brief 默认是否允许访问网络
     */
    bool network_enabled = false;

    /**
     * @brief 是否允许使用 local 后端
     * local 后端直接在宿主机上执行代码，没有任何隔离，只能用于开发调试
     */
    bool enable_local_backend = false;

    /**
     * @brief 存放临时工作目录的文件夹，为空时使用系统临时目录
     */
    std::filesystem::path scratch_dir;

    /**
     * @brief 超时后删除容器的最长等待时间，单位为秒
     */
    int stop_grace_sec = 5;

    /**
     * @brief stdout 和 stderr 各自最多保留的字节数
     */
    size_t max_output_bytes = 1 << 20;

    /**
     * @brief 容器内的最大进程数
     */
    int pids_limit = 256;

    /**
     * @brief 容器内单个文件的最大大小，单位为字节
     */
    long long file_size_limit_bytes = 100000000;

    /**
     * @brief 容器运行时的路径，为空时根据 backend 在 PATH 中查找
     */
    std::string runtime_path;

    size_t max_artifact_bytes() const;

    /**
     * @brief 实际使用的临时目录：scratch_dir 或系统临时目录
     */
    std::filesystem::path scratch_root() const;
};

/**
 * @brief 进程的全部静态配置
 * 启动时加载并校验一次，之后以常引用的方式传给执行器和后端，不再修改
 */
struct configuration {
    server_config server;
    sandbox_config sandbox;
    std::map<sandbox::language, sandbox::language_config> languages;

    configuration();

    /**
     * @brief 获取语言的配置
     * @throw language_error 若该语言没有配置
     */
    const sandbox::language_config &language(sandbox::language lang) const;

    /**
     * @brief 检查配置是否合法
     * @throw configuration_error 配置不合法
     */
    void validate() const;
};

void from_json(const nlohmann::json &j, server_config &config);
void from_json(const nlohmann::json &j, sandbox_config &config);
void from_json(const nlohmann::json &j, sandbox::language_config &config);
void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 在内置默认值的基础上应用 JSON 配置并校验
 * @throw configuration_error 配置格式错误或者不合法
 */
configuration parse_configuration(const nlohmann::json &j);

/**
 * @brief 从文件加载配置
 * @throw configuration_error 文件无法读取、格式错误或者不合法
 */
configuration load_configuration(const std::filesystem::path &path);

}  // namespace codebox
