#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace codebox::sandbox {

/**
 * @brief 支持的运行时
 */
enum class language {
    PYTHON,
    NODEJS,
    GO,
    CPP
};

/**
 * @brief 所有支持的语言，顺序固定
 */
const std::vector<language> &supported_languages();

/**
 * @brief 语言的标识符，即请求和配置文件中使用的名称：python, nodejs, go, cpp
 */
std::string to_string(language lang);

/**
 * @brief 根据标识符查找语言
 * @throw language_error 若语言不受支持
 */
language parse_language(const std::string &name);

std::ostream &operator<<(std::ostream &os, language lang);

/**
 * @brief 一种语言的静态配置
 * 进程启动时加载一次，之后只读，因此可以被多个 worker 同时访问
 */
struct language_config {
    /**
     * @brief 容器后端使用的镜像
     */
    std::string image;

    /**
     * @brief 用户代码写入工作目录时使用的文件名，比如 main.py
     * 只能是单个文件名，不能包含路径分隔符
     */
    std::string file_name;

    /**
     * @brief 编译命令，在工作目录下通过 sh -c 执行，可以为空
     * @code
     * g++ -std=c++17 -O2 -o app main.cpp
     * @endcode
     */
    std::string build_cmd;

    /**
     * @brief 运行命令，在工作目录下通过 sh -c 执行，仅在编译成功后执行
     */
    std::string run_cmd;

    /**
     * @brief 插入到用户代码之前和之后的代码
     */
    std::string prefix_code, postfix_code;

    /**
     * @brief 注入到被执行程序的环境变量
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 打包产物时排除的路径模式，参见 is_excluded
     */
    std::vector<std::string> exclude_patterns;

    /**
     * @brief 拼接编译命令和运行命令，交给 sh -c 执行
     */
    std::string shell_command() const;
};

/**
 * @brief 内置的语言默认配置，配置文件中缺省的字段从这里取值
 */
language_config default_language_config(language lang);

/**
 * @brief 在用户代码前后拼接语言配置的 prefix_code 和 postfix_code
 */
std::string apply_hooks(const language_config &config, const std::string &code);

}  // namespace codebox::sandbox
