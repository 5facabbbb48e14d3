#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "ojudge/common/cancellation.hpp"

namespace ojudge {

/**
 * @brief 运行一个子进程的设置
 */
struct run_options {
    /**
     * @brief 命令及参数，command[0] 会在 PATH 中查找
     * 参数直接传给 execvp，不经过 shell
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 写入子进程标准输入的数据，写完后关闭标准输入
     */
    std::string stdin_data;

    /**
     * @brief 是否将标准错误合并到标准输出，编译器输出诊断信息时使用
     */
    bool merge_stderr = false;

    /**
     * @brief 时钟时间限制，小于 0 表示不限制
     * 超时后整个进程组将被 SIGKILL 杀死
     */
    std::chrono::milliseconds wall_limit{-1};

    /**
     * @brief 内存限制（字节），小于 0 表示不限制
     * 进程树的常驻内存超过限制时整个进程组将被 SIGKILL 杀死
     */
    int64_t memory_limit = -1;

    /**
     * @brief 标准输出和标准错误各自最多保存多少字节，多余的数据会被读取并丢弃
     */
    std::size_t stream_size = 64 << 20;

    /**
     * @brief 标准输出超过 stream_size 时是否立即杀死子进程
     */
    bool kill_on_stream_limit = false;

    /**
     * @brief 内存采样间隔，同时也是检查取消请求的间隔
     */
    std::chrono::milliseconds sample_interval{10};

    /**
     * @brief 取消标记，可以为空
     */
    const cancellation_token *cancel = nullptr;
};

/**
 * @brief 子进程的运行结果
 */
struct run_result {
    /**
     * @brief 子进程是否成功启动（execvp 成功）
     * 为 false 时 spawn_error 保存失败原因，其余字段没有意义
     */
    bool started = false;

    std::string spawn_error;

    /**
     * @brief 子进程的 pid，也是子进程所在进程组的 id
     */
    pid_t pid = -1;

    /**
     * @brief 子进程的返回值，因信号终止时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 时钟时间
     */
    std::chrono::milliseconds wall_time{0};

    /**
     * @brief 用户态和内核态 CPU 时间之和
     */
    std::chrono::milliseconds cpu_time{0};

    /**
     * @brief 进程树的内存使用峰值（字节）
     * 取运行期间采样的最大值与内核记录的常驻内存峰值（ru_maxrss）中较大者
     */
    int64_t memory = 0;

    bool time_exceeded = false;

    bool memory_exceeded = false;

    /**
     * @brief 标准输出的数据量超过了 stream_size
     */
    bool output_exceeded = false;

    bool cancelled = false;

    /**
     * @brief 子进程在自行退出之前被评测进程杀死（超时、内存超限、输出超限或者取消）
     */
    bool killed = false;

    std::string out, err;

    /**
     * @brief 子进程是否正常退出且返回值为 0
     */
    bool succeeded() const;
};

/**
 * @brief 运行子进程并等待其结束
 * 1. 通过 pipe2(O_CLOEXEC) 建立标准输入输出的管道，避免并发评测的任务互相继承文件描述符
 * 2. fork 子进程，子进程调用 setsid 成为新的进程组，以便通过一个 SIGKILL 杀死整个进程树，
 *    然后重定向标准输入输出、切换工作路径、禁止 core dump 并调用 execvp
 * 3. 父进程通过 CLOEXEC 的状态管道得知 execvp 是否成功
 * 4. 父进程用 poll 同时等待管道数据和 pidfd（内核不支持时退化为按采样间隔轮询），
 *    每个采样间隔读取一次进程树的内存，检查时间限制和取消请求
 * 5. 子进程退出或者被杀死后，向整个进程组发送 SIGKILL 确保没有残留进程，
 *    再通过 wait4 回收子进程并读取资源使用情况
 * 在任何退出路径上（包括抛出异常）子进程都会被杀死并回收。
 * @throw std::system_error 管道、fork 等系统调用失败
 */
run_result run_process(const run_options &opt);

/**
 * @brief 读取以 root 为根的进程树的内存使用（字节）
 * 通过 /proc/[pid]/task/[tid]/children 遍历子进程，读取每个进程 /proc/[pid]/status 中的 VmRSS 和 VmHWM，
 * 返回进程树常驻内存之和与单个进程常驻内存峰值中较大者。
 * 进程已经退出时返回 0
 * 已知盲区：在两次采样之间申请内存并退出的子进程，如果峰值没有超过评测进程自身的常驻内存，不会被统计到
 */
int64_t process_tree_memory(pid_t root);

}  // namespace ojudge
