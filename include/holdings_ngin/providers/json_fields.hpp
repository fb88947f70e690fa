// include/holdings_ngin/providers/json_fields.hpp
#pragma once

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace holdings_ngin {
namespace json_fields {

/**
 * @brief Walk nested objects, e.g. find_path(pos, {"symbol", "symbol", "currency"})
 * @return Pointer to the value, or nullptr if any step is missing or not an object
 */
const nlohmann::json* find_path(const nlohmann::json& obj,
                                std::initializer_list<const char*> path);

/**
 * @brief Non-empty string field; numbers are not coerced
 */
std::optional<std::string> get_string(const nlohmann::json& obj, const char* key);
std::optional<std::string> get_string(const nlohmann::json& obj,
                                      std::initializer_list<const char*> path);

/**
 * @brief Finite numeric field; numeric strings ("12.5") are accepted
 */
std::optional<double> get_number(const nlohmann::json& obj, const char* key);
std::optional<double> get_number(const nlohmann::json& obj,
                                 std::initializer_list<const char*> path);

/**
 * @brief Boolean field; absent or non-boolean yields the fallback
 */
bool get_bool(const nlohmann::json& obj, const char* key, bool fallback = false);

}  // namespace json_fields
}  // namespace holdings_ngin
