#pragma once

#include <atomic>

namespace ojudge {

/**
 * @brief 评测任务的取消标记
 * 调用方持有该对象并在任意线程调用 cancel()，比如重测覆盖了正在评测的提交。
 * 评测引擎在每个测试点开始前检查标记，运行中的用户程序会在下一次内存采样时
 * 被杀死，因此取消请求会在一个采样周期内生效。
 * cancel() 只是一次无锁的原子写入，可以在信号处理函数中调用。
 */
struct cancellation_token {
    void cancel() noexcept { flag.store(true, std::memory_order_relaxed); }

    bool cancelled() const noexcept { return flag.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag{false};
};

}  // namespace ojudge
