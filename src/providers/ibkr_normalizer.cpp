// src/providers/ibkr_normalizer.cpp
#include "holdings_ngin/providers/ibkr_normalizer.hpp"
#include <limits>
#include <unordered_map>
#include "holdings_ngin/providers/json_fields.hpp"

namespace holdings_ngin {

namespace {

std::string map_ibkr_asset_class(const std::string& asset_class) {
    static const std::unordered_map<std::string, std::string> types = {
        {"STK", "equity"},     {"FUND", "mutual_fund"}, {"BOND", "bond"},
        {"OPT", "derivative"}, {"FOP", "derivative"},   {"FUT", "derivative"},
        {"WAR", "warrant"},    {"CASH", "cash"},        {"CRYPTO", "crypto"},
        {"CMDTY", "commodity"}};
    auto it = types.find(asset_class);
    return it == types.end() ? "" : it->second;
}

}  // namespace

void IbkrNormalizer::do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                                  NormalizationResult& out) const {
    const nlohmann::json* positions = &payload;
    if (payload.is_object()) {
        positions = json_fields::find_path(payload, {"positions"});
    }
    if (!positions || !positions->is_array()) {
        add_malformed(out, provider_id, "IBKR payload has no positions array");
        return;
    }

    size_t index = 0;
    for (const auto& pos : *positions) {
        const std::string desc = "ibkr position #" + std::to_string(index++);

        auto quantity = json_fields::get_number(pos, "position");
        auto currency = json_fields::get_string(pos, "currency").value_or("");
        auto account_id = json_fields::get_string(pos, "acctId").value_or("");
        auto type = map_ibkr_asset_class(json_fields::get_string(pos, "assetClass").value_or(""));

        if (type == "cash") {
            if (!quantity) {
                add_malformed(out, provider_id, "Dropped " + desc + ": missing quantity");
                continue;
            }
            emit(out, make_cash_position(currency, *quantity, account_id, provider_id), desc);
            continue;
        }

        Position position;
        position.provider_id = provider_id;
        position.ticker = json_fields::get_string(pos, "ticker")
                              .value_or(json_fields::get_string(pos, "contractDesc").value_or(""));
        position.quantity = quantity.value_or(std::numeric_limits<double>::quiet_NaN());
        position.currency = currency;
        position.security_type_hint = type;
        position.account_id = account_id;
        if (auto avg_cost = json_fields::get_number(pos, "avgCost"); avg_cost && quantity)
            position.cost_basis = *avg_cost * *quantity;
        position.market_value = json_fields::get_number(pos, "mktValue");
        emit(out, std::move(position), desc);
    }
}

}  // namespace holdings_ngin
