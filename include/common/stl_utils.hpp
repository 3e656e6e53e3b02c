#pragma once

#include <string>
#include <vector>

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

/**
 * @brief 按分隔符拆分字符串，保留空的片段
 * @code{.cpp}
 *     split("a//b", '/') == {"a", "", "b"}
 * @endcode
 */
std::vector<std::string> split(const std::string &str, char delim);

/**
 * @brief 判断 str 是否以 suffix 结尾
 */
bool ends_with(const std::string &str, const std::string &suffix);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
