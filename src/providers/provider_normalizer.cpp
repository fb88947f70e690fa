// src/providers/provider_normalizer.cpp
#include "holdings_ngin/providers/provider_normalizer.hpp"
#include <cmath>
#include "holdings_ngin/core/logger.hpp"

namespace holdings_ngin {

NormalizationResult ProviderNormalizer::normalize(const nlohmann::json& payload,
                                                  const std::string& provider_id) const {
    NormalizationResult out;
    try {
        do_normalize(payload, provider_id, out);
    } catch (const nlohmann::json::exception& e) {
        add_malformed(out, provider_id,
                      "Unreadable " + format() + " payload: " + std::string(e.what()));
    } catch (const std::exception& e) {
        add_malformed(out, provider_id,
                      "Failed to normalize " + format() + " payload: " + std::string(e.what()));
    }

    for (auto& position : out.positions) {
        position.provider_id = provider_id;
    }

    DEBUG("Normalized " << out.positions.size() << " positions from " << provider_id << " ("
                        << format() << "), " << out.warnings.size() << " warnings");
    return out;
}

bool ProviderNormalizer::emit(NormalizationResult& out, Position position,
                              const std::string& record_desc) {
    position.ticker = normalize_ticker(position.ticker);
    position.currency = normalize_currency(position.currency);

    if (position.ticker.empty() || !std::isfinite(position.quantity)) {
        add_malformed(out, position.provider_id,
                      "Dropped " + record_desc + ": missing ticker or quantity", position.ticker);
        return false;
    }

    out.positions.push_back(std::move(position));
    return true;
}

void ProviderNormalizer::add_malformed(NormalizationResult& out, const std::string& provider_id,
                                       const std::string& message, const std::string& ticker) {
    WARN("MalformedRecord from " << provider_id << ": " << message);
    out.warnings.push_back(Warning{WarningCode::MALFORMED_RECORD, message, ticker, provider_id});
}

Position ProviderNormalizer::make_cash_position(const std::string& currency, Quantity amount,
                                                const std::string& account_id,
                                                const std::string& provider_id) {
    auto ccy = normalize_currency(currency);
    Position cash(std::string(CASH_TICKER_PREFIX) + ccy, amount, ccy, provider_id);
    cash.security_type_hint = "cash";
    cash.account_id = account_id;
    cash.market_value = amount;
    return cash;
}

}  // namespace holdings_ngin
