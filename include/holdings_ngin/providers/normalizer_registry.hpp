// include/holdings_ngin/providers/normalizer_registry.hpp
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "holdings_ngin/core/error.hpp"
#include "holdings_ngin/providers/provider_normalizer.hpp"

namespace holdings_ngin {

/**
 * @brief Maps payload formats to normalizers
 */
class NormalizerRegistry {
public:
    /**
     * @brief Registry with every supplied normalizer
     * (plaid, snaptrade, schwab, ibkr, canonical)
     */
    static NormalizerRegistry with_defaults();

    /**
     * @brief Register a normalizer under its format, replacing any previous one
     */
    void register_normalizer(std::shared_ptr<const ProviderNormalizer> normalizer);

    /**
     * @brief Look up the normalizer for a format
     * @return The normalizer or DATA_NOT_FOUND
     */
    Result<std::shared_ptr<const ProviderNormalizer>> get(const std::string& format) const;

    /**
     * @brief Normalize every payload; unregistered formats produce UNKNOWN_PROVIDER
     */
    NormalizationResult normalize_all(const std::vector<ProviderPayload>& payloads) const;

    std::vector<std::string> formats() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const ProviderNormalizer>> normalizers_;
};

}  // namespace holdings_ngin
