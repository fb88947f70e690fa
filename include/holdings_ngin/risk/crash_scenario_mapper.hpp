// include/holdings_ngin/risk/crash_scenario_mapper.hpp
#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "holdings_ngin/core/config_base.hpp"
#include "holdings_ngin/core/error.hpp"
#include "holdings_ngin/core/types.hpp"

namespace holdings_ngin {

/**
 * @brief Named crash scenario and its severity (fractional drawdown)
 */
struct CrashScenario {
    std::string name;
    double severity{0.0};
};

/**
 * @brief Scenario table and security type -> scenario mapping
 */
struct CrashScenarioConfig : public ConfigBase {
    std::map<std::string, double> scenarios{{"single_stock_crash", 0.80},
                                            {"etf_crash", 0.35},
                                            {"fund_crash", 0.40},
                                            {"mutual_fund_crash", 0.40},
                                            {"cash_crash", 0.05}};

    std::map<std::string, std::string> type_to_scenario{{"equity", "single_stock_crash"},
                                                        {"etf", "etf_crash"},
                                                        {"fund", "fund_crash"},
                                                        {"mutual_fund", "mutual_fund_crash"},
                                                        {"cash", "cash_crash"}};

    std::vector<ConfigValidationError> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Maps a security type to its crash scenario
 *
 * Types without a mapping get the equity scenario, the conservative choice.
 * Immutable after creation.
 */
class CrashScenarioMapper {
public:
    /**
     * @brief Validate the table and build a mapper
     * @return INVALID_CONFIGURATION if the table is empty, a severity lies outside
     * [0, 1], a mapping names a missing scenario, or equity is unmapped
     */
    static Result<std::shared_ptr<const CrashScenarioMapper>> create(
        const CrashScenarioConfig& config);

    CrashScenario map_to_scenario(SecurityType type) const;
    CrashScenario map_to_scenario(const std::string& security_type) const;

    /**
     * @brief True if the type has its own mapping rather than the equity fallback
     */
    bool has_mapping(const std::string& security_type) const;

private:
    explicit CrashScenarioMapper(std::map<std::string, CrashScenario> mapping,
                                 CrashScenario fallback);

    std::map<std::string, CrashScenario> mapping_;
    CrashScenario fallback_;
};

}  // namespace holdings_ngin
