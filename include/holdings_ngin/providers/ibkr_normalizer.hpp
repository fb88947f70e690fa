// include/holdings_ngin/providers/ibkr_normalizer.hpp
#pragma once

#include "holdings_ngin/providers/provider_normalizer.hpp"

namespace holdings_ngin {

/**
 * @brief Normalizer for Interactive Brokers portfolio positions
 */
class IbkrNormalizer : public ProviderNormalizer {
public:
    std::string format() const override {
        return "ibkr";
    }

protected:
    void do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                      NormalizationResult& out) const override;
};

}  // namespace holdings_ngin
