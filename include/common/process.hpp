#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codebox {

/**
 * @brief 描述一次外部程序调用
 */
struct process_options {
    /**
     * @brief 外部命令的路径 (argv[0]) 和参数，不经过 shell 解释
     */
    std::vector<std::string> argv;

    /**
     * @brief 额外的环境变量，会覆盖同名的继承环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 是否继承当前进程的环境变量
     * 为假时子进程只能看到 env 中的环境变量
     */
    bool inherit_env = true;

    /**
     * @brief 子进程的工作路径，为空时继承当前工作路径
     */
    std::filesystem::path workdir;

    /**
     * @brief 时钟时间限制，为 0 时不限制
     * 超时后会先向整个进程组发送 SIGTERM，100ms 后再发送 SIGKILL
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout 和 stderr 各自最多保留的字节数，超出部分会被读取并丢弃
     */
    size_t output_limit = 1 << 20;
};

struct process_result {
    std::string out;
    std::string err;

    /**
     * @brief 进程的返回值，若进程因为信号退出，则为 128 + 信号值
     */
    int exitcode = -1;

    /**
     * @brief 导致进程退出的信号，没有则为 0
     */
    int signal = 0;

    /**
     * @brief 进程是否因为超时被杀死
     */
    bool timed_out = false;

    bool out_truncated = false;
    bool err_truncated = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 外部程序的调用方式
 * 执行后端通过这个接口启动外部程序，测试时可以替换成不真正创建进程的实现
 */
struct process_runner {
    virtual ~process_runner() = default;

    /**
     * @brief 运行外部程序并等待其结束或超时
     * 非 0 的返回值不是错误；只有无法创建进程、无法执行命令时才抛出异常
     * @throw std::system_error 无法创建子进程或者无法执行 argv[0]
     */
    virtual process_result run(const process_options &options) = 0;
};

/**
 * @brief 通过 fork/exec 实现的 process_runner
 */
struct posix_process_runner : public process_runner {
    process_result run(const process_options &options) override;
};

}  // namespace codebox
