// include/holdings_ngin/consolidation/provider_priority_config.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "holdings_ngin/core/config_base.hpp"

namespace holdings_ngin {

/**
 * @brief Provider priorities used to pick position metadata
 * Higher value wins. Providers not listed get default_priority.
 */
struct ProviderPriorityConfig : public ConfigBase {
    std::map<std::string, int> priorities{
        {"plaid", 10}, {"snaptrade", 20}, {"schwab", 30}, {"ibkr", 30}};
    int default_priority{0};

    int priority_of(const std::string& provider_id) const {
        auto it = priorities.find(provider_id);
        return it == priorities.end() ? default_priority : it->second;
    }

    std::vector<ConfigValidationError> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace holdings_ngin
