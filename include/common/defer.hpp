#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = codeeval::scoped_guard() + [&]

namespace codeeval {

/**
 * @brief 在离开作用域时执行清理函数
 * 清理函数抛出的异常会被记录到日志中，不会从析构函数中传播出去，
 * 因此清理失败不会掩盖原本的返回值或者异常。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace codeeval
