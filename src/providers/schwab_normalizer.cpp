// src/providers/schwab_normalizer.cpp
#include "holdings_ngin/providers/schwab_normalizer.hpp"
#include <limits>
#include <unordered_map>
#include "holdings_ngin/providers/json_fields.hpp"

namespace holdings_ngin {

namespace {

constexpr const char* SCHWAB_CURRENCY = "USD";

std::string map_schwab_asset_type(const std::string& asset_type) {
    static const std::unordered_map<std::string, std::string> types = {
        {"EQUITY", "equity"},
        {"MUTUAL_FUND", "mutual_fund"},
        {"COLLECTIVE_INVESTMENT", "etf"},
        {"FIXED_INCOME", "bond"},
        {"OPTION", "derivative"},
        {"FUTURE", "derivative"},
        {"CASH_EQUIVALENT", "cash"},
        {"CURRENCY", "cash"}};
    auto it = types.find(asset_type);
    return it == types.end() ? "" : it->second;
}

}  // namespace

void SchwabNormalizer::do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                                    NormalizationResult& out) const {
    std::vector<const nlohmann::json*> accounts;
    auto collect = [&accounts](const nlohmann::json& entry) {
        if (const auto* account = json_fields::find_path(entry, {"securitiesAccount"}))
            accounts.push_back(account);
    };
    if (payload.is_array()) {
        for (const auto& entry : payload)
            collect(entry);
    } else {
        collect(payload);
    }

    if (accounts.empty()) {
        add_malformed(out, provider_id, "Schwab payload has no securitiesAccount");
        return;
    }

    size_t index = 0;
    for (const auto* account : accounts) {
        auto account_id = json_fields::get_string(*account, "accountNumber").value_or("");

        if (const auto* positions = json_fields::find_path(*account, {"positions"});
            positions && positions->is_array()) {
            for (const auto& pos : *positions) {
                const std::string desc = "schwab position #" + std::to_string(index++);

                auto long_qty = json_fields::get_number(pos, "longQuantity");
                auto short_qty = json_fields::get_number(pos, "shortQuantity");

                Position position;
                position.provider_id = provider_id;
                position.ticker = json_fields::get_string(pos, {"instrument", "symbol"}).value_or("");
                position.quantity = (long_qty || short_qty)
                                        ? long_qty.value_or(0.0) - short_qty.value_or(0.0)
                                        : std::numeric_limits<double>::quiet_NaN();
                position.currency = SCHWAB_CURRENCY;
                position.security_type_hint = map_schwab_asset_type(
                    json_fields::get_string(pos, {"instrument", "assetType"}).value_or(""));
                position.account_id = account_id;
                if (auto avg = json_fields::get_number(pos, "averagePrice"))
                    position.cost_basis = *avg * position.quantity;
                position.market_value = json_fields::get_number(pos, "marketValue");
                emit(out, std::move(position), desc);
            }
        }

        if (auto cash = json_fields::get_number(*account, {"currentBalances", "cashBalance"})) {
            emit(out, make_cash_position(SCHWAB_CURRENCY, *cash, account_id, provider_id),
                 "schwab cash balance");
        }
    }
}

}  // namespace holdings_ngin
