// src/pipeline/pipeline_config.cpp
#include "holdings_ngin/pipeline/pipeline_config.hpp"

namespace holdings_ngin {

namespace {

void append(std::vector<ConfigValidationError>& dst, std::vector<ConfigValidationError> src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()),
               std::make_move_iterator(src.end()));
}

}  // namespace

std::vector<ConfigValidationError> PipelineConfig::validate() const {
    std::vector<ConfigValidationError> errors;
    append(errors, provider_priorities.validate());
    append(errors, classification.validate());
    append(errors, crash_scenarios.validate());
    append(errors, retry.validate());

    auto currency = normalize_currency(default_cash_currency);
    if (currency.size() != 3) {
        errors.push_back({"default_cash_currency", "Must be a 3-letter currency code"});
    }
    if (classification_table.empty()) {
        errors.push_back({"classification_table", "Must not be empty"});
    }
    return errors;
}

nlohmann::json PipelineConfig::to_json() const {
    nlohmann::json j;
    j["provider_priorities"] = provider_priorities.to_json();
    j["classification"] = classification.to_json();
    j["crash_scenarios"] = crash_scenarios.to_json();
    j["retry"] = retry.to_json();
    j["logging"] = logging.to_json();
    j["fmp"] = fmp.to_json();
    j["default_cash_currency"] = default_cash_currency;
    j["database_connection_string"] = database_connection_string;
    j["classification_table"] = classification_table;
    j["authoritative_enabled"] = authoritative_enabled;
    return j;
}

void PipelineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("provider_priorities"))
        provider_priorities.from_json(j.at("provider_priorities"));
    if (j.contains("classification"))
        classification.from_json(j.at("classification"));
    if (j.contains("crash_scenarios")) {
        crash_scenarios.from_json(j.at("crash_scenarios"));
    } else {
        crash_scenarios.scenarios.clear();
        crash_scenarios.type_to_scenario.clear();
    }
    if (j.contains("retry"))
        retry.from_json(j.at("retry"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("fmp"))
        fmp.from_json(j.at("fmp"));
    if (j.contains("default_cash_currency"))
        default_cash_currency = j.at("default_cash_currency").get<std::string>();
    if (j.contains("database_connection_string"))
        database_connection_string = j.at("database_connection_string").get<std::string>();
    if (j.contains("classification_table"))
        classification_table = j.at("classification_table").get<std::string>();
    if (j.contains("authoritative_enabled"))
        authoritative_enabled = j.at("authoritative_enabled").get<bool>();
}

}  // namespace holdings_ngin
