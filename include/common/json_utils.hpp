#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

inline std::invalid_argument build_invalid_argument(const json &j, const std::string &key) {
    return std::invalid_argument("Unexpected value type of: " + key + " in " + j.dump(2));
}

/**
 * @brief 若 j 中存在键 key 且不为 null，将值读入 value，否则 value 不变
 * 用于读取带默认值的配置项
 * @throw std::invalid_argument 键存在但是值的类型不正确
 */
template <typename T>
void assign_optional(const json &j, T &value, const std::string &key) {
    if (!j.is_object() || !j.count(key)) return;
    const json &res = j.at(key);
    if (res.is_null()) return;
    try {
        res.get_to(value);
    } catch (json::exception &e) {
        throw build_invalid_argument(j, key);
    }
}

template <typename T>
T get_value_def(const json &j, const T &def_value, const std::string &key) {
    T value = def_value;
    assign_optional(j, value, key);
    return value;
}

}  // namespace nlohmann
