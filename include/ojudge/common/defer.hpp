#pragma once

#include <functional>

#define OJUDGE_DEFER_1(x, y) x##y
#define OJUDGE_DEFER_2(x, y) OJUDGE_DEFER_1(x, y)
#define OJUDGE_DEFER_0(x) OJUDGE_DEFER_2(x, __COUNTER__)

/**
 * 在当前作用域结束时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     auto ws = workspace::create(root, "1001");
 *     defer { ws.destroy(); };
 * @endcode
 */
#define defer auto OJUDGE_DEFER_0(_deferred_action) = ::ojudge::scoped_guard() + [&]

namespace ojudge {

/**
 * @brief 作用域守卫，析构时调用保存的函数
 * 只能移动，确保保存的函数最多被调用一次
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace ojudge
