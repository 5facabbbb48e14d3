#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace ojudge {

/**
 * @brief 评测引擎抛出的所有异常的基类
 * 构造时会记录调用栈，通过 operator<< 输出到日志时会附带调用栈信息
 */
struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

protected:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交的语言不受支持
 * 在启动任何进程之前抛出，调用方应当拒绝该提交
 */
struct unsupported_language : public judge_exception {
    explicit unsupported_language(const std::string &language);

    const std::string language;
};

/**
 * @brief 表示无法为评测任务分配工作目录
 * 比如目录已经存在、磁盘已满、没有写权限或者任务 id 不合法
 */
struct workspace_allocation_error : public judge_exception {
    explicit workspace_allocation_error(const std::string &message);
};

/**
 * @brief 表示评测任务本身不合法
 * 比如源代码超出长度限制、时间或内存限制不为正数
 */
struct invalid_task : public judge_exception {
    explicit invalid_task(const std::string &message);
};

/**
 * @brief 表示评测引擎的内部错误
 * 在评测过程中抛出的该异常最终会转换为 System Error 的评测结果
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace ojudge
