#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 沿着 keys 逐层查找 JSON 节点
 * @return 节点的指针，任意一层不存在或者节点为 null 时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&...keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref && !ref->is_null() ? ref : nullptr;
}

template <typename... Keys>
bool exists(const json &j, Keys &&...keys) {
    return find_path(j, keys...) != nullptr;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&...keys) {
    std::string msg = "Unexpected value type of: ";
    auto append = [&msg](const auto &key) {
        msg += boost::lexical_cast<std::string>(key) + ".";
    };
    (append(keys), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&...keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&...keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::type_error &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 字段存在时赋值给 value，不存在或者为 null 时保持 value 不变
 * @throw std::invalid_argument 字段存在但类型不正确
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&...keys) {
    const json *res = find_path(j, keys...);
    if (!res) return;
    try {
        res->get_to(value);
    } catch (json::type_error &) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
