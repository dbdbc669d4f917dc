#pragma once

#include <filesystem>

namespace codebox::sandbox {

/**
 * @brief 一次请求独占的临时工作目录
 *
 * scratch_root
 * └── codebox-<uuid>  // 权限 0700，防止宿主机上的其他用户访问
 *     └── workdir     // 权限 0777，容器内以 nobody 身份运行的程序需要写入
 *
 * 析构时删除整个 codebox-<uuid> 文件夹，包括执行过程中产生的所有文件。
 */
struct workspace {
    /**
     * @brief 在 scratch_root 下创建新的工作目录
     * @throw std::filesystem::filesystem_error 无法创建文件夹
     */
    explicit workspace(const std::filesystem::path &scratch_root);
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;
    ~workspace();

    /**
     * @brief 工作目录的路径，用户代码写入这里，容器将其挂载到 /workdir
     */
    const std::filesystem::path &path() const;

    /**
     * @brief 删除工作目录，可以重复调用，失败时仅记录日志
     */
    void remove() noexcept;

private:
    std::filesystem::path root;
    std::filesystem::path workdir;
};

}  // namespace codebox::sandbox
