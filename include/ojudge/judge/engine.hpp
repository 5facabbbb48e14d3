#pragma once

#include <filesystem>
#include <functional>
#include <vector>
#include "ojudge/common/cancellation.hpp"
#include "ojudge/config.hpp"
#include "ojudge/judge/task.hpp"
#include "ojudge/language.hpp"
#include "ojudge/workspace.hpp"

namespace ojudge::judge {

/**
 * @brief 一次评测所处的阶段
 * PENDING -> COMPILING -> RUNNING（每个测试点一次） -> AGGREGATED
 * 预检失败（语言不支持、任务不合法、无法分配工作目录）时进入 FAILED
 */
enum class judge_phase {
    PENDING,
    COMPILING,
    RUNNING,
    AGGREGATED,
    FAILED
};

const char *get_phase_name(judge_phase phase);

/**
 * @brief 评测引擎
 * 负责一次评测的完整流程：分配工作目录、写入代码、编译、依次运行测试点、
 * 汇总结果、删除工作目录。
 *
 * 引擎构造后只读，多个线程可以同时调用 judge()，每次调用独占自己的工作目录、
 * 子进程和缓冲区。回调函数需要在第一次调用 judge() 之前注册，
 * 回调会在评测线程中同步调用，并发评测时回调函数需要自己处理同步。
 */
struct judge_engine {
    judge_engine(engine_config config, language_registry registry);

    /**
     * @brief 评测一个提交
     * 工作目录在返回前一定会被删除，无论评测成功、编译失败、被取消还是出现异常。
     * 评测过程中的错误都会转换为 System Error 的评测结果。
     * @param task 评测任务
     * @param cancel 取消标记，可以为空
     * @throw unsupported_language 语言不受支持
     * @throw invalid_task 代码超出长度限制，时间、内存限制不为正数或过大，或者测试点分数为负数或过大
     * @throw workspace_allocation_error 无法分配工作目录
     */
    judge_result judge(const judge_task &task, const cancellation_token *cancel = nullptr) const;

    /**
     * @brief 注册测试点评测结束的事件回调函数
     * 回调函数在每个测试点评测完成后按顺序调用
     */
    void on_test_case_finished(std::function<void(const judge_task &, const test_case_result &)> callback);

    /**
     * @brief 注册评测结束的事件回调函数
     * 回调函数在工作目录删除后、judge() 返回前被调用，通常用来返回提交结果
     */
    void on_judge_finished(std::function<void(const judge_task &, const judge_result &)> callback);

    /**
     * @brief 注册评测阶段变化的事件回调函数
     * 第三个参数为 RUNNING 阶段正在运行的测试点下标，其他阶段为 0
     */
    void on_phase_changed(std::function<void(const judge_task &, judge_phase, std::size_t)> callback);

    const engine_config &config() const;

    const language_registry &registry() const;

private:
    void fire_test_case_finished(const judge_task &task, const test_case_result &result) const;
    void fire_judge_finished(const judge_task &task, const judge_result &result) const;
    void fire_phase_changed(const judge_task &task, judge_phase phase, std::size_t index = 0) const;

    void validate(const judge_task &task) const;

    void run_test_cases(const judge_task &task, const workspace &ws, const language_profile &profile,
                        const std::filesystem::path &artifact, judge_result &result, const cancellation_token *cancel) const;

    engine_config conf;
    language_registry languages;

    std::vector<std::function<void(const judge_task &, const test_case_result &)>> test_case_finished;
    std::vector<std::function<void(const judge_task &, const judge_result &)>> judge_finished;
    std::vector<std::function<void(const judge_task &, judge_phase, std::size_t)>> phase_changed;
};

/**
 * @brief 根据已评测的测试点汇总总体结果、总分、最长时间和最大内存
 * 只依赖 result.cases、result.cancelled 和 task 的计分方式，重复调用结果不变。
 * 编译错误和系统错误的结果由评测流程直接设置，不经过汇总。
 */
void aggregate(const judge_task &task, judge_result &result);

}  // namespace ojudge::judge
