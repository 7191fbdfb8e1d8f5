#pragma once

#include <functional>

#define SANDBOX_DEFER_1(x, y) x##y
#define SANDBOX_DEFER_2(x, y) SANDBOX_DEFER_1(x, y)
#define SANDBOX_DEFER_0(x) SANDBOX_DEFER_2(x, __COUNTER__)

/**
 * @brief 在作用域结束时执行清理代码，无论是正常返回、提前返回还是抛出异常
 * @code{.cpp}
 *     auto dir = make_run_directory(root);
 *     defer { remove_directory(dir); };
 * @endcode
 */
#define defer auto SANDBOX_DEFER_0(_deferred_action) = sandbox::scoped_guard() + [&]

namespace sandbox {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;
    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace sandbox
