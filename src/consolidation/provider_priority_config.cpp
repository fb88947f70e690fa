// src/consolidation/provider_priority_config.cpp
#include "holdings_ngin/consolidation/provider_priority_config.hpp"

namespace holdings_ngin {

std::vector<ConfigValidationError> ProviderPriorityConfig::validate() const {
    std::vector<ConfigValidationError> errors;
    for (const auto& [provider, priority] : priorities) {
        if (provider.empty()) {
            errors.push_back({"provider_priorities", "Provider id must not be empty"});
        }
    }
    return errors;
}

nlohmann::json ProviderPriorityConfig::to_json() const {
    nlohmann::json j;
    j["priorities"] = priorities;
    j["default_priority"] = default_priority;
    return j;
}

void ProviderPriorityConfig::from_json(const nlohmann::json& j) {
    if (j.contains("priorities")) {
        priorities.clear();
        for (const auto& [provider, priority] : j.at("priorities").items()) {
            priorities[provider] = priority.get<int>();
        }
    }
    if (j.contains("default_priority"))
        default_priority = j.at("default_priority").get<int>();
}

}  // namespace holdings_ngin
