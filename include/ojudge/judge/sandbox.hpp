#pragma once

#include <boost/rational.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include "ojudge/common/cancellation.hpp"
#include "ojudge/config.hpp"
#include "ojudge/judge/task.hpp"
#include "ojudge/language.hpp"
#include "ojudge/workspace.hpp"

namespace ojudge::judge {

/**
 * @brief 题目声明的资源限制，还没有乘以语言倍数
 */
struct run_limits {
    std::chrono::milliseconds time{1000};

    /**
     * @brief 内存限制（MB）
     */
    int64_t memory = 256;

    /**
     * @brief 格式错误的得分比例
     */
    boost::rational<int> pe_ratio{4, 5};
};

/**
 * @brief 实际的时间限制：题目时间限制乘以语言的时间倍数
 */
std::chrono::milliseconds effective_time_limit(const language_profile &profile, std::chrono::milliseconds base);

/**
 * @brief 实际的内存限制（字节）：题目内存限制乘以语言的内存倍数
 */
int64_t effective_memory_limit(const language_profile &profile, int64_t base_mb);

/**
 * @brief 运行一个测试点并得到评测结果
 * 用户程序在工作目录中以独立的进程组运行，测试点输入写入标准输入后关闭。
 * 结果的判定顺序为：Time Limit Exceeded、Memory Limit Exceeded、Runtime Error、
 * Output Limit Exceeded，最后才比较输出。
 * 无法启动用户程序或者评测被取消时返回 System Error，不会抛出异常。
 * @param artifact 编译产物，解释型语言为源代码文件
 * @param index 测试点的下标
 */
test_case_result run(const workspace &ws, const language_profile &profile, const std::filesystem::path &artifact,
                     const test_case &testcase, std::size_t index, const run_limits &limits,
                     const engine_config &config, const cancellation_token *cancel = nullptr);

}  // namespace ojudge::judge
