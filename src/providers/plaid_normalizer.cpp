// src/providers/plaid_normalizer.cpp
#include "holdings_ngin/providers/plaid_normalizer.hpp"
#include <limits>
#include <unordered_map>
#include "holdings_ngin/providers/json_fields.hpp"

namespace holdings_ngin {

namespace {

struct PlaidSecurity {
    std::string ticker;
    std::string type;
    std::string currency;
    bool cash_equivalent{false};
};

std::string map_plaid_type(const std::string& type) {
    static const std::unordered_map<std::string, std::string> types = {
        {"equity", "equity"},          {"etf", "etf"},
        {"mutual fund", "mutual_fund"}, {"fixed income", "bond"},
        {"cash", "cash"},              {"cryptocurrency", "crypto"},
        {"derivative", "derivative"}};
    auto it = types.find(type);
    return it == types.end() ? type : it->second;
}

}  // namespace

void PlaidNormalizer::do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                                   NormalizationResult& out) const {
    const auto* holdings = json_fields::find_path(payload, {"holdings"});
    if (!holdings || !holdings->is_array()) {
        add_malformed(out, provider_id, "Plaid payload has no holdings array");
        return;
    }

    std::unordered_map<std::string, PlaidSecurity> securities;
    if (const auto* list = json_fields::find_path(payload, {"securities"}); list && list->is_array()) {
        for (const auto& sec : *list) {
            auto id = json_fields::get_string(sec, "security_id");
            if (!id)
                continue;
            PlaidSecurity info;
            info.ticker = json_fields::get_string(sec, "ticker_symbol").value_or("");
            info.type = map_plaid_type(json_fields::get_string(sec, "type").value_or(""));
            info.currency = json_fields::get_string(sec, "iso_currency_code")
                                .value_or(json_fields::get_string(sec, "unofficial_currency_code")
                                              .value_or(""));
            info.cash_equivalent =
                json_fields::get_bool(sec, "is_cash_equivalent") || info.type == "cash";
            securities[*id] = std::move(info);
        }
    }

    size_t index = 0;
    for (const auto& holding : *holdings) {
        const std::string desc = "plaid holding #" + std::to_string(index++);

        auto security_id = json_fields::get_string(holding, "security_id").value_or("");
        auto sec_it = securities.find(security_id);
        const PlaidSecurity* security = sec_it == securities.end() ? nullptr : &sec_it->second;

        auto currency = json_fields::get_string(holding, "iso_currency_code")
                            .value_or(json_fields::get_string(holding, "unofficial_currency_code")
                                          .value_or(security ? security->currency : ""));
        auto quantity = json_fields::get_number(holding, "quantity");
        auto account_id = json_fields::get_string(holding, "account_id").value_or("");

        if (security && security->cash_equivalent) {
            if (!quantity) {
                add_malformed(out, provider_id, "Dropped " + desc + ": missing quantity");
                continue;
            }
            auto cash = make_cash_position(currency, *quantity, account_id, provider_id);
            if (auto value = json_fields::get_number(holding, "institution_value"))
                cash.market_value = *value;
            emit(out, std::move(cash), desc);
            continue;
        }

        Position position;
        position.provider_id = provider_id;
        position.ticker = security ? security->ticker : "";
        position.quantity = quantity.value_or(std::numeric_limits<double>::quiet_NaN());
        position.currency = currency;
        position.security_type_hint = security ? security->type : "";
        position.account_id = account_id;
        position.cost_basis = json_fields::get_number(holding, "cost_basis");
        position.market_value = json_fields::get_number(holding, "institution_value");
        emit(out, std::move(position), desc);
    }
}

}  // namespace holdings_ngin
