#pragma once

#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 代码检查的结果
 */
struct screen_report {
    bool safe = true;

    /**
     * @brief 检查出的问题，每项一条
     */
    std::vector<std::string> issues;
};

/**
 * @brief 检查代码中是否存在可疑的调用（比如 system、popen、subprocess）以及代码是否过长
 * 这只是基于正则表达式的粗略检查，容易绕过，不能代替真正的隔离。
 * 评测引擎本身不会调用这个函数，是否拒绝可疑代码由调用方决定。
 * 没有规则的语言只检查长度。
 */
screen_report screen_source(const std::string &code, const std::string &language, std::size_t max_length);

}  // namespace ojudge
