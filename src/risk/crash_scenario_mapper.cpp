// src/risk/crash_scenario_mapper.cpp
#include "holdings_ngin/risk/crash_scenario_mapper.hpp"
#include <cmath>
#include "holdings_ngin/core/logger.hpp"

namespace holdings_ngin {

std::vector<ConfigValidationError> CrashScenarioConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    if (scenarios.empty()) {
        errors.push_back({"crash_scenarios.scenarios", "Scenario table is empty"});
    }
    for (const auto& [name, severity] : scenarios) {
        if (!std::isfinite(severity) || severity < 0.0 || severity > 1.0) {
            errors.push_back({"crash_scenarios.scenarios." + name,
                              "Severity must be within [0, 1]"});
        }
    }

    for (const auto& [type, scenario] : type_to_scenario) {
        if (!security_type_from_string(type)) {
            errors.push_back({"crash_scenarios.type_to_scenario." + type,
                              "Unknown security type"});
        }
        if (scenarios.find(scenario) == scenarios.end()) {
            errors.push_back({"crash_scenarios.type_to_scenario." + type,
                              "Scenario '" + scenario + "' is not defined"});
        }
    }

    if (type_to_scenario.find("equity") == type_to_scenario.end()) {
        errors.push_back({"crash_scenarios.type_to_scenario.equity",
                          "Equity mapping is required as the fallback scenario"});
    }
    return errors;
}

nlohmann::json CrashScenarioConfig::to_json() const {
    nlohmann::json j;
    j["scenarios"] = scenarios;
    j["type_to_scenario"] = type_to_scenario;
    return j;
}

void CrashScenarioConfig::from_json(const nlohmann::json& j) {
    if (j.contains("scenarios")) {
        scenarios.clear();
        for (const auto& [name, severity] : j.at("scenarios").items()) {
            scenarios[name] = severity.get<double>();
        }
    }
    if (j.contains("type_to_scenario")) {
        type_to_scenario.clear();
        for (const auto& [type, scenario] : j.at("type_to_scenario").items()) {
            type_to_scenario[type] = scenario.get<std::string>();
        }
    }
}

Result<std::shared_ptr<const CrashScenarioMapper>> CrashScenarioMapper::create(
    const CrashScenarioConfig& config) {
    auto validation = to_result(config.validate(), "CrashScenarioMapper");
    if (validation.is_error()) {
        return make_error<std::shared_ptr<const CrashScenarioMapper>>(
            validation.error()->code(), validation.error()->what(), "CrashScenarioMapper");
    }

    std::map<std::string, CrashScenario> mapping;
    for (const auto& [type, scenario] : config.type_to_scenario) {
        mapping[type] = CrashScenario{scenario, config.scenarios.at(scenario)};
    }
    CrashScenario fallback = mapping.at("equity");

    return std::shared_ptr<const CrashScenarioMapper>(
        new CrashScenarioMapper(std::move(mapping), std::move(fallback)));
}

CrashScenarioMapper::CrashScenarioMapper(std::map<std::string, CrashScenario> mapping,
                                         CrashScenario fallback)
    : mapping_(std::move(mapping)), fallback_(std::move(fallback)) {}

CrashScenario CrashScenarioMapper::map_to_scenario(SecurityType type) const {
    return map_to_scenario(security_type_to_string(type));
}

CrashScenario CrashScenarioMapper::map_to_scenario(const std::string& security_type) const {
    auto it = mapping_.find(security_type);
    if (it == mapping_.end()) {
        TRACE("No crash scenario for '" << security_type << "', using " << fallback_.name);
        return fallback_;
    }
    return it->second;
}

bool CrashScenarioMapper::has_mapping(const std::string& security_type) const {
    return mapping_.find(security_type) != mapping_.end();
}

}  // namespace holdings_ngin
