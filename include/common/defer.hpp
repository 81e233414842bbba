#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 离开作用域时执行代码块
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = oibox::scoped_guard() + [&]

namespace oibox {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace oibox
