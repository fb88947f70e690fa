// src/providers/json_fields.cpp
#include "holdings_ngin/providers/json_fields.hpp"
#include <cmath>
#include <cstdlib>

namespace holdings_ngin {
namespace json_fields {

namespace {
std::optional<std::string> as_string(const nlohmann::json* value) {
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    auto text = value->get<std::string>();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    return text;
}

std::optional<double> as_number(const nlohmann::json* value) {
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number()) {
        double number = value->get<double>();
        if (!std::isfinite(number))
            return std::nullopt;
        return number;
    }
    if (value->is_string()) {
        const auto& text = value->get_ref<const std::string&>();
        if (text.empty())
            return std::nullopt;
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0' || !std::isfinite(number))
            return std::nullopt;
        return number;
    }
    return std::nullopt;
}
}  // namespace

const nlohmann::json* find_path(const nlohmann::json& obj,
                                std::initializer_list<const char*> path) {
    const nlohmann::json* current = &obj;
    for (const char* key : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(key);
        if (it == current->end() || it->is_null()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

std::optional<std::string> get_string(const nlohmann::json& obj, const char* key) {
    return as_string(find_path(obj, {key}));
}

std::optional<std::string> get_string(const nlohmann::json& obj,
                                      std::initializer_list<const char*> path) {
    return as_string(find_path(obj, path));
}

std::optional<double> get_number(const nlohmann::json& obj, const char* key) {
    return as_number(find_path(obj, {key}));
}

std::optional<double> get_number(const nlohmann::json& obj,
                                 std::initializer_list<const char*> path) {
    return as_number(find_path(obj, path));
}

bool get_bool(const nlohmann::json& obj, const char* key, bool fallback) {
    const auto* value = find_path(obj, {key});
    if (!value || !value->is_boolean()) {
        return fallback;
    }
    return value->get<bool>();
}

}  // namespace json_fields
}  // namespace holdings_ngin
