// src/providers/canonical_normalizer.cpp
#include "holdings_ngin/providers/canonical_normalizer.hpp"
#include <limits>
#include "holdings_ngin/providers/json_fields.hpp"

namespace holdings_ngin {

void CanonicalNormalizer::do_normalize(const nlohmann::json& payload,
                                       const std::string& provider_id,
                                       NormalizationResult& out) const {
    const nlohmann::json* records = &payload;
    if (payload.is_object()) {
        records = json_fields::find_path(payload, {"positions"});
    }
    if (!records || !records->is_array()) {
        add_malformed(out, provider_id, "Canonical payload has no positions array");
        return;
    }

    size_t index = 0;
    for (const auto& record : *records) {
        Position position;
        position.provider_id = provider_id;
        position.ticker = json_fields::get_string(record, "ticker").value_or("");
        position.quantity = json_fields::get_number(record, "quantity")
                                .value_or(std::numeric_limits<double>::quiet_NaN());
        position.currency = json_fields::get_string(record, "currency").value_or("");
        position.security_type_hint = json_fields::get_string(record, "type").value_or("");
        position.account_id = json_fields::get_string(record, "account_id").value_or("");
        position.cost_basis = json_fields::get_number(record, "cost_basis");
        position.market_value = json_fields::get_number(record, "value");
        emit(out, std::move(position), "canonical record #" + std::to_string(index++));
    }
}

}  // namespace holdings_ngin
