#pragma once

#include <string>

namespace sandbox {

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

/**
 * @brief 判断字符串是否为非空的十进制非负整数
 */
bool is_integer(const std::string &s);

}  // namespace sandbox
