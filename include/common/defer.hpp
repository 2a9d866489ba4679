#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::verifier::scoped_guard() + [&]

namespace verifier {

/**
 * @brief 在离开作用域时执行清理函数
 * 配合 defer 宏使用，比如沙箱的临时目录清理、子进程回收。
 * 调用 dismiss 后将不再执行清理函数。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    void dismiss();
};

}  // namespace verifier
