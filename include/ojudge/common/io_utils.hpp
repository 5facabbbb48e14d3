#pragma once

#include <filesystem>
#include <string>

namespace ojudge {

/**
 * @brief 读取文件的全部内容
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 原样写入文件，文件存在时会被覆盖
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 确保 name 是一个普通的文件名，不能包含路径分隔符或者是 . 和 ..
 * 用于把外部传入的任务 id 拼接成路径前的检查
 * @return 检查通过时返回 name 本身
 * @throw std::invalid_argument 如果 name 不安全
 */
std::string assert_safe_path(const std::string &name);

}  // namespace ojudge
