#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 描述一种编程语言的编译和运行方式
 * 命令以参数列表的形式保存，允许的占位符有：
 * {source}: 源代码文件的绝对路径
 * {artifact}: 编译产物的绝对路径
 * {dir}: 工作目录的绝对路径
 * 占位符按参数逐个替换，任何时候都不会经过 shell。
 */
struct language_profile {
    /**
     * @brief 语言标识符，比如 cpp、python
     */
    std::string id;

    /**
     * @brief 源代码文件名（不含扩展名）
     * Java 要求文件名和 public class 名一致，因此 Java 为 Main
     */
    std::string source_name = "main";

    /**
     * @brief 源代码扩展名，包含点号，比如 .cpp
     */
    std::string extension;

    /**
     * @brief 编译命令，解释型语言没有编译命令
     */
    std::optional<std::vector<std::string>> compile_command;

    /**
     * @brief 编译产物的文件名（相对于工作目录）
     * 编译器返回 0 之后还需要检查这个文件是否存在才认为编译成功
     */
    std::string artifact_name;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> run_command;

    /**
     * @brief 时间限制倍数，不小于 1，用来补偿解释器、虚拟机的额外开销
     */
    double time_multiplier = 1;

    /**
     * @brief 内存限制倍数，不小于 1
     */
    double memory_multiplier = 1;

    bool compiled() const;

    std::string source_file() const;
};

void from_json(const nlohmann::json &j, language_profile &profile);
void to_json(nlohmann::json &j, const language_profile &profile);

/**
 * @brief 语言表，从语言标识符查找语言配置
 * 进程启动时构造一次，之后只读，可以被多个评测线程共享而不需要加锁。
 */
struct language_registry {
    /**
     * @brief 内置的语言表：c、cpp、java、python、javascript
     */
    static language_registry builtin();

    /**
     * @brief 从 JSON 数组加载语言表
     * @throw std::invalid_argument 语言配置不合法或者语言标识符重复
     */
    static language_registry from_json(const nlohmann::json &j);

    /**
     * @brief 加入一种语言
     * @throw std::invalid_argument 语言配置不合法或者语言标识符重复
     */
    void add(language_profile profile);

    /**
     * @brief 查找语言配置，不会回退到任何默认语言
     * @throw unsupported_language 如果语言不存在
     */
    const language_profile &resolve(const std::string &language) const;

    bool contains(const std::string &language) const;

    /**
     * @brief 所有支持的语言标识符（按字典序）
     */
    std::vector<std::string> languages() const;

private:
    std::map<std::string, language_profile> profiles;
};

/**
 * @brief 展开语言配置中的命令模板
 * {source} 为 dir 下的源代码文件，{artifact} 为 dir 下的编译产物（解释型语言为源代码文件），{dir} 为 dir 本身
 * @throw std::invalid_argument 模板中存在未知的占位符
 */
std::vector<std::string> expand_profile_command(const std::vector<std::string> &templ, const language_profile &profile, const std::filesystem::path &dir);

/**
 * @brief 估算评测一个提交所需的时间
 * 所有测试点跑满时间限制，加上编译时间和系统开销
 */
std::chrono::milliseconds estimate_judge_time(const language_profile &profile, std::size_t test_cases, std::chrono::milliseconds time_limit);

}  // namespace ojudge
