#pragma once

#include <string>

namespace codeeval {

/**
 * @brief 字符串是否只由数字组成（不允许符号、空白）
 */
bool is_integer(const std::string &s);

/**
 * @brief 用于 std::visit 的多 lambda 组合
 * @code{.cpp}
 *     std::visit(overloaded{[](outcome::passed &) {}, [](auto &) {}}, result);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace codeeval
