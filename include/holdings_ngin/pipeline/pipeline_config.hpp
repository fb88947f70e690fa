// include/holdings_ngin/pipeline/pipeline_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "holdings_ngin/classification/classification_cache.hpp"
#include "holdings_ngin/classification/fmp_classifier.hpp"
#include "holdings_ngin/classification/retry_policy.hpp"
#include "holdings_ngin/consolidation/provider_priority_config.hpp"
#include "holdings_ngin/core/config_base.hpp"
#include "holdings_ngin/core/logger.hpp"
#include "holdings_ngin/risk/crash_scenario_mapper.hpp"

namespace holdings_ngin {

/**
 * @brief Complete static configuration of the consolidation engine
 *
 * When loaded from JSON the crash_scenarios section is mandatory; a file without
 * it fails validation instead of silently using built-in severities.
 */
struct PipelineConfig : public ConfigBase {
    ProviderPriorityConfig provider_priorities;
    ClassificationCacheConfig classification;
    CrashScenarioConfig crash_scenarios;
    RetryPolicy retry;
    LoggerConfig logging;
    FmpConfig fmp;

    std::string default_cash_currency{"USD"};

    // Empty disables the persistent tier
    std::string database_connection_string;
    std::string classification_table{"reference.security_types"};

    bool authoritative_enabled{true};

    std::vector<ConfigValidationError> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace holdings_ngin
