// include/holdings_ngin/providers/plaid_normalizer.hpp
#pragma once

#include "holdings_ngin/providers/provider_normalizer.hpp"

namespace holdings_ngin {

/**
 * @brief Normalizer for Plaid investment holdings (holdings joined to securities by security_id)
 */
class PlaidNormalizer : public ProviderNormalizer {
public:
    std::string format() const override {
        return "plaid";
    }

protected:
    void do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                      NormalizationResult& out) const override;
};

}  // namespace holdings_ngin
