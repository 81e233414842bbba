#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include "common/exceptions.hpp"

namespace oibox {

namespace detail {

template <typename... Keys>
const nlohmann::json *find_path(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
std::string key_path(const Keys &... keys) {
    std::string msg;
    ((msg += (msg.empty() ? "" : ".") + boost::lexical_cast<std::string>(keys)), ...);
    return msg;
}

}  // namespace detail

/**
 * @brief 判断 j[keys...] 是否存在且不为 null
 */
template <typename... Keys>
bool exists(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = detail::find_path(j, keys...);
    return ref && !ref->is_null();
}

/**
 * @brief 读取 j[keys...]，不存在或者类型不对时抛出 validation_error
 */
template <typename T, typename... Keys>
T get_value(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = detail::find_path(j, keys...);
    if (!ref || ref->is_null())
        throw validation_error("Missing required argument " + detail::key_path(keys...));
    try {
        return ref->get<T>();
    } catch (nlohmann::json::exception &) {
        throw validation_error("Unexpected value type of argument " + detail::key_path(keys...));
    }
}

/**
 * @brief 读取 j[keys...]，不存在或为 null 时返回 def_value，类型不对时抛出 validation_error
 */
template <typename T, typename... Keys>
T get_value_def(const nlohmann::json &j, const T &def_value, const Keys &... keys) {
    const nlohmann::json *ref = detail::find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (nlohmann::json::exception &) {
        throw validation_error("Unexpected value type of argument " + detail::key_path(keys...));
    }
}

}  // namespace oibox
