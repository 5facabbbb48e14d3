#pragma once

#include <boost/rational.hpp>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "ojudge/common/status.hpp"

namespace ojudge::judge {

/**
 * @brief 计分方式
 */
enum class scoring_policy {
    /**
     * @brief 遇到第一个未通过的测试点就停止评测，只有全部通过才得分
     */
    ACM,

    /**
     * @brief 评测所有测试点，总分为各测试点得分之和
     */
    OI
};

struct test_case {
    /**
     * @brief 写入用户程序标准输入的数据
     */
    std::string input;

    /**
     * @brief 标准输出
     */
    std::string output;

    /**
     * @brief 本测试点的满分
     */
    int points = 10;
};

/**
 * @brief 一次评测请求
 */
struct judge_task {
    /**
     * @brief 任务 id，会作为工作目录名的一部分，必须是一个普通的文件名
     */
    std::string id;

    /**
     * @brief 语言标识符，参见 language_registry
     */
    std::string language;

    std::string source;

    /**
     * @brief 题目的时间限制，实际限制还要乘以语言的时间倍数
     */
    std::chrono::milliseconds time_limit{1000};

    /**
     * @brief 题目的内存限制（MB），实际限制还要乘以语言的内存倍数
     */
    int64_t memory_limit = 256;

    /**
     * @brief 测试点，按顺序评测
     */
    std::vector<test_case> cases;

    scoring_policy policy = scoring_policy::ACM;

    /**
     * @brief 格式错误的得分比例，为空时使用评测引擎的配置
     */
    std::optional<boost::rational<int>> presentation_ratio;
};

/**
 * @brief 单个测试点的评测结果
 */
struct test_case_result {
    /**
     * @brief 测试点在 judge_task::cases 中的下标
     */
    std::size_t index = 0;

    status result = status::SYSTEM_ERROR;

    /**
     * @brief 时钟时间（毫秒）
     */
    std::chrono::milliseconds time{0};

    /**
     * @brief CPU 时间（毫秒）
     */
    std::chrono::milliseconds cpu_time{0};

    /**
     * @brief 内存使用峰值（KB）
     */
    int64_t memory = 0;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 用户程序的输出，截断到 max_report_size，仅用于诊断
     */
    std::string output;

    /**
     * @brief 本测试点获得的分数
     */
    int score = 0;

    /**
     * @brief 诊断信息，比如运行时错误的原因
     */
    std::string message;
};

/**
 * @brief 整个提交的评测结果
 */
struct judge_result {
    std::string task_id;

    /**
     * @brief 按顺序第一个未通过的测试点的结果，全部通过时为 ACCEPTED
     */
    status result = status::SYSTEM_ERROR;

    int score = 0;

    /**
     * @brief 已评测的测试点中最长的运行时间（毫秒）
     */
    std::chrono::milliseconds time{0};

    /**
     * @brief 已评测的测试点中最大的内存使用（KB）
     */
    int64_t memory = 0;

    /**
     * @brief 编译器输出
     */
    std::string compile_output;

    /**
     * @brief 系统错误的原因
     */
    std::string error;

    bool cancelled = false;

    /**
     * @brief 已评测的测试点的结果，下标与 judge_task::cases 一一对应
     */
    std::vector<test_case_result> cases;
};

/**
 * @brief 解析评测请求
 * @code{.json}
 * {
 *     "id": "1001",
 *     "language": "cpp",
 *     "source": "...",
 *     "timeLimit": 1000,
 *     "memoryLimit": 256,
 *     "policy": "acm",
 *     "presentationRatio": "4/5",
 *     "testCases": [
 *         { "input": "1 2\n", "output": "3\n", "points": 10 }
 *     ]
 * }
 * @endcode
 * @throw std::invalid_argument 缺少必要字段或者字段类型不正确
 */
void from_json(const nlohmann::json &j, judge_task &task);
void from_json(const nlohmann::json &j, test_case &value);
void from_json(const nlohmann::json &j, scoring_policy &policy);

void to_json(nlohmann::json &j, const scoring_policy &policy);
void to_json(nlohmann::json &j, const test_case_result &value);
void to_json(nlohmann::json &j, const judge_result &value);

}  // namespace ojudge::judge
