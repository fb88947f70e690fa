// include/holdings_ngin/providers/schwab_normalizer.hpp
#pragma once

#include "holdings_ngin/providers/provider_normalizer.hpp"

namespace holdings_ngin {

/**
 * @brief Normalizer for Schwab trader API accounts (long/short quantities, USD only)
 */
class SchwabNormalizer : public ProviderNormalizer {
public:
    std::string format() const override {
        return "schwab";
    }

protected:
    void do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                      NormalizationResult& out) const override;
};

}  // namespace holdings_ngin
