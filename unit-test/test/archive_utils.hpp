#pragma once

#include <sys/types.h>
#include <ctime>
#include <map>
#include <string>
#include <vector>

/**
 * 测试用的 tar 工具，直接使用 libarchive 构造和读取压缩包，不经过被测试的 archive 模块
 * 用法：
 * 1. tar_builder().file("main.py", "print(1)").symlink("link", "/etc/passwd").gzip()
 * 2. list_archive(create_archive(...)) 得到文件名到内容的映射
 */
namespace codebox::test {

enum class tar_format {
    PAX,

    /**
     * @brief GNU tar 格式，长文件名使用 'L' 类型的条目保存
     */
    GNU
};

struct tar_builder {
    explicit tar_builder(tar_format format = tar_format::PAX);

    tar_builder &file(const std::string &name, const std::string &content, mode_t mode = 0644);
    tar_builder &directory(const std::string &name);
    tar_builder &symlink(const std::string &name, const std::string &target);
    tar_builder &hard_link(const std::string &name, const std::string &target);

    /**
     * @brief 添加任意类型的条目，比如 AE_IFCHR、AE_IFIFO，名字不做任何检查
     */
    tar_builder &entry(const std::string &name, mode_t type, const std::string &content = "", mode_t mode = 0644);

    /**
     * @brief 未压缩的 tar 数据
     */
    std::string tar() const;

    std::string gzip() const;

private:
    struct item {
        std::string name;
        mode_t type;
        std::string content;
        std::string symlink;
        std::string hardlink;
        mode_t mode;
    };

    std::string write(bool compress) const;

    tar_format format;
    std::vector<item> items;
};

std::string gzip_compress(const std::string &data);

struct archive_item {
    std::string content;
    mode_t mode = 0;
    time_t mtime = 0;
    bool directory = false;
};

/**
 * @brief 读取 gzip 压缩的 tar 包中的全部条目
 * @return 条目名到条目的映射，文件夹以 '/' 结尾
 */
std::map<std::string, archive_item> read_archive(const std::string &data);

/**
 * @brief 列出 gzip 压缩的 tar 包中的条目
 * @return 条目名到内容的映射，文件夹以 '/' 结尾，内容为空
 */
std::map<std::string, std::string> list_archive(const std::string &data);

}  // namespace codebox::test
