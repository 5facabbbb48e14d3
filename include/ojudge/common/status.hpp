#pragma once

#include <string>

namespace ojudge {

/**
 * @brief 表示单个测试点或整个提交的评测结果
 * 除 ACCEPTED 以外的结果都会让提交的总体结果变为对应的状态，
 * 总体结果取按顺序第一个不为 ACCEPTED 的测试点的结果。
 */
enum class status {
    /**
     * @brief 本测试点通过，或者编译通过（还未评测）
     * 输出在去除末尾空白字符后与标准输出完全一致。
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 即使把连续的空白字符压缩成一个空格，输出仍然与标准输出不一致。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 格式错误
     * 输出与标准输出仅在空白字符上有差异（比如行中多余的空格、多余的空行）。
     * 格式错误的测试点会获得部分分，比例由评测配置决定。
     */
    PRESENTATION_ERROR = 2,

    /**
     * @brief 用户程序运行时间超出限制
     * 时间限制为时钟时间，超时后整个进程组会被 SIGKILL 杀死。
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序运行内存超限
     * 只要进程树在运行过程中的内存峰值超过限制就会返回该结果，
     * 即使程序在退出前释放了内存并正常退出。
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序的标准输出过多
     */
    OUTPUT_LIMIT_EXCEEDED = 5,

    /**
     * @brief 用户程序出现运行时错误
     * 程序返回值不为 0，或者因为信号而崩溃。
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 用户程序编译错误
     * 编译器返回值不为 0、编译超时，或者编译器没有生成可执行文件。
     */
    COMPILE_ERROR = 7,

    /**
     * @brief 内部错误，评测系统出错
     * 比如无法启动编译器或用户程序、评测被取消、评测逻辑抛出异常。
     * 这种错误不应归咎于用户代码。
     */
    SYSTEM_ERROR = 8
};

/**
 * @brief 获得评测结果的显示名称，比如 "Wrong Answer"
 */
const char *get_display_message(status);

}  // namespace ojudge
