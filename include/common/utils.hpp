#pragma once

#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace oibox {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表（不含 argv[0]）
 * 参数列表总是逐个构造，不会拼接成命令行交给 shell 解析
 * @code{.cpp}
 *     std::filesystem::path source("/sandbox/sources/a.cpp");
 *     std::vector<std::string> flags = {"-Wall", "-Wextra"};
 *     // {"/sandbox/sources/a.cpp", "-std=c++17", "-Wall", "-Wextra"}
 *     auto args = make_arguments(source, "-std=c++17", flags);
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_arguments(const Args &... args) {
    std::vector<std::string> list;
    if constexpr (sizeof...(args) > 0)
        to_string_list(list, args...);
    return list;
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

}  // namespace oibox
