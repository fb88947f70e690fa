// include/holdings_ngin/providers/canonical_normalizer.hpp
#pragma once

#include "holdings_ngin/providers/provider_normalizer.hpp"

namespace holdings_ngin {

/**
 * @brief Normalizer for the engine's own flat record shape, used to re-ingest consolidated output
 */
class CanonicalNormalizer : public ProviderNormalizer {
public:
    std::string format() const override {
        return "canonical";
    }

protected:
    void do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                      NormalizationResult& out) const override;
};

}  // namespace holdings_ngin
