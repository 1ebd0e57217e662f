/**
 * @file result.cpp
 * @brief Value conversions
 */

#include "smither/result.hpp"

namespace smither {

std::optional<bool> Value::try_bool() const noexcept {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    if (auto* v = std::get_if<int64_t>(&value_)) {
        if (*v == 0 || *v == 1) return *v == 1;
        return std::nullopt;
    }
    if (auto* v = std::get_if<std::string>(&value_)) {
        if (*v == "t" || *v == "true") return true;
        if (*v == "f" || *v == "false") return false;
    }
    return std::nullopt;
}

std::optional<std::string_view> Value::try_string() const noexcept {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    return std::nullopt;
}

std::string Value::to_string() const {
    if (is_null()) return "NULL";
    if (auto* v = std::get_if<bool>(&value_)) return *v ? "true" : "false";
    if (auto* v = std::get_if<int64_t>(&value_)) return std::to_string(*v);
    if (auto* v = std::get_if<double>(&value_)) return std::to_string(*v);
    return std::get<std::string>(value_);
}

}  // namespace smither
