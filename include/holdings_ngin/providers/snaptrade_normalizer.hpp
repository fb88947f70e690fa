// include/holdings_ngin/providers/snaptrade_normalizer.hpp
#pragma once

#include "holdings_ngin/providers/provider_normalizer.hpp"

namespace holdings_ngin {

/**
 * @brief Normalizer for SnapTrade account holdings (positions plus cash balances)
 */
class SnapTradeNormalizer : public ProviderNormalizer {
public:
    std::string format() const override {
        return "snaptrade";
    }

protected:
    void do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                      NormalizationResult& out) const override;
};

}  // namespace holdings_ngin
