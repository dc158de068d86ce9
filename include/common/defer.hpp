#pragma once

#include <functional>

#define ASSESSOR_DEFER_1(x, y) x##y
#define ASSESSOR_DEFER_2(x, y) ASSESSOR_DEFER_1(x, y)
#define ASSESSOR_DEFER_0(x) ASSESSOR_DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行给定的代码块
 * 无论作用域是正常结束还是因为异常退出，代码块都会被执行，
 * 用于删除临时文件、回收子进程等必须执行的清理工作。
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto ASSESSOR_DEFER_0(_defered_option) = ::assessor::scoped_guard() + [&]

namespace assessor {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace assessor
