#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_action) = ::hindsight::scoped_guard() + [&]

namespace hindsight {

/**
 * @brief 在离开作用域时执行清理动作
 * 清理动作抛出的异常只会记录日志，不会在栈展开时再次抛出
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(std::function<void()> f) const;

    /**
     * @brief 取消清理动作
     */
    void dismiss();

private:
    std::function<void()> f;
};

}  // namespace hindsight
