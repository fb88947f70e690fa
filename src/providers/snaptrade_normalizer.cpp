// src/providers/snaptrade_normalizer.cpp
#include "holdings_ngin/providers/snaptrade_normalizer.hpp"
#include <limits>
#include <unordered_map>
#include "holdings_ngin/providers/json_fields.hpp"

namespace holdings_ngin {

namespace {

// SnapTrade security type codes
std::string map_snaptrade_type(const std::string& code) {
    static const std::unordered_map<std::string, std::string> types = {
        {"cs", "equity"},  {"ad", "equity"},     {"ps", "equity"},
        {"et", "etf"},     {"oef", "mutual_fund"}, {"cef", "fund"},
        {"bnd", "bond"},   {"crypto", "crypto"}, {"wt", "warrant"},
        {"rt", "derivative"}};
    auto it = types.find(code);
    return it == types.end() ? code : it->second;
}

}  // namespace

void SnapTradeNormalizer::do_normalize(const nlohmann::json& payload,
                                       const std::string& provider_id,
                                       NormalizationResult& out) const {
    // Account holdings object, an array of them, or a bare array of positions
    if (payload.is_array() && !payload.empty() && payload.front().contains("symbol")) {
        nlohmann::json wrapped = {{"positions", payload}};
        do_normalize(wrapped, provider_id, out);
        return;
    }

    std::vector<const nlohmann::json*> accounts;
    if (payload.is_array()) {
        for (const auto& account : payload)
            accounts.push_back(&account);
    } else if (payload.is_object()) {
        accounts.push_back(&payload);
    } else {
        add_malformed(out, provider_id, "SnapTrade payload is neither an object nor an array");
        return;
    }

    size_t index = 0;
    for (const auto* account : accounts) {
        auto account_id = json_fields::get_string(*account, {"account", "id"}).value_or("");

        if (const auto* positions = json_fields::find_path(*account, {"positions"});
            positions && positions->is_array()) {
            for (const auto& pos : *positions) {
                const std::string desc = "snaptrade position #" + std::to_string(index++);

                auto units = json_fields::get_number(pos, "units");
                auto avg_price = json_fields::get_number(pos, "average_purchase_price");
                auto price = json_fields::get_number(pos, "price");

                Position position;
                position.provider_id = provider_id;
                position.ticker =
                    json_fields::get_string(pos, {"symbol", "symbol", "symbol"}).value_or("");
                position.quantity = units.value_or(std::numeric_limits<double>::quiet_NaN());
                position.currency =
                    json_fields::get_string(pos, {"symbol", "symbol", "currency", "code"})
                        .value_or(json_fields::get_string(pos, {"currency", "code"}).value_or(""));
                position.security_type_hint = map_snaptrade_type(
                    json_fields::get_string(pos, {"symbol", "symbol", "type", "code"})
                        .value_or(""));
                position.account_id = json_fields::get_string(pos, "account_id").value_or(account_id);
                if (units && avg_price)
                    position.cost_basis = *units * *avg_price;
                if (units && price)
                    position.market_value = *units * *price;
                emit(out, std::move(position), desc);
            }
        }

        if (const auto* balances = json_fields::find_path(*account, {"balances"});
            balances && balances->is_array()) {
            for (const auto& balance : *balances) {
                auto currency = json_fields::get_string(balance, {"currency", "code"});
                auto cash = json_fields::get_number(balance, "cash");
                if (!currency || !cash) {
                    add_malformed(out, provider_id,
                                  "Dropped snaptrade balance: missing currency or cash amount");
                    continue;
                }
                emit(out, make_cash_position(*currency, *cash, account_id, provider_id),
                     "snaptrade balance " + *currency);
            }
        }
    }
}

}  // namespace holdings_ngin
