#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 生成一个随机的 uuid（不带连字符，32 个十六进制字符）
 * 用于工作目录的唯一标识，多个线程可以同时调用
 */
std::string random_uuid();

/**
 * @brief 将命令模板中的占位符替换为实际值
 * 每个参数单独替换，结果仍然是参数列表，不会拼接成 shell 命令，
 * 因此文件名中的空格和特殊字符不会导致命令注入。
 * @param templ 命令模板，比如 {"g++", "-o", "{artifact}", "{source}"}
 * @param values 占位符的值，键为不带花括号的名称，比如 "source"
 * @throw std::invalid_argument 模板中存在未知的占位符
 */
std::vector<std::string> expand_command(const std::vector<std::string> &templ, const std::map<std::string, std::string> &values);

/**
 * @brief 截断过长的文本，保证不会从 UTF-8 字符的中间截断
 * @param limit 最多保留多少个字节
 */
std::string truncate_text(const std::string &text, std::size_t limit);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace ojudge
