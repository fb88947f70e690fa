// src/providers/normalizer_registry.cpp
#include "holdings_ngin/providers/normalizer_registry.hpp"
#include <algorithm>
#include "holdings_ngin/core/logger.hpp"
#include "holdings_ngin/providers/canonical_normalizer.hpp"
#include "holdings_ngin/providers/ibkr_normalizer.hpp"
#include "holdings_ngin/providers/plaid_normalizer.hpp"
#include "holdings_ngin/providers/schwab_normalizer.hpp"
#include "holdings_ngin/providers/snaptrade_normalizer.hpp"

namespace holdings_ngin {

NormalizerRegistry NormalizerRegistry::with_defaults() {
    NormalizerRegistry registry;
    registry.register_normalizer(std::make_shared<PlaidNormalizer>());
    registry.register_normalizer(std::make_shared<SnapTradeNormalizer>());
    registry.register_normalizer(std::make_shared<SchwabNormalizer>());
    registry.register_normalizer(std::make_shared<IbkrNormalizer>());
    registry.register_normalizer(std::make_shared<CanonicalNormalizer>());
    return registry;
}

void NormalizerRegistry::register_normalizer(std::shared_ptr<const ProviderNormalizer> normalizer) {
    if (!normalizer) {
        return;
    }
    auto format = normalizer->format();
    normalizers_[format] = std::move(normalizer);
}

Result<std::shared_ptr<const ProviderNormalizer>> NormalizerRegistry::get(
    const std::string& format) const {
    auto it = normalizers_.find(format);
    if (it == normalizers_.end()) {
        return make_error<std::shared_ptr<const ProviderNormalizer>>(
            ErrorCode::DATA_NOT_FOUND, "No normalizer registered for format: " + format,
            "NormalizerRegistry");
    }
    return it->second;
}

NormalizationResult NormalizerRegistry::normalize_all(
    const std::vector<ProviderPayload>& payloads) const {
    NormalizationResult combined;

    for (const auto& payload : payloads) {
        const auto& format = payload.effective_format();
        auto normalizer = get(format);
        if (normalizer.is_error()) {
            WARN("UnknownProvider: skipping payload from '" << payload.provider_id
                                                              << "' with format '" << format << "'");
            combined.warnings.push_back(Warning{WarningCode::UNKNOWN_PROVIDER,
                                                normalizer.error()->what(), "",
                                                payload.provider_id});
            continue;
        }

        auto result = normalizer.value()->normalize(payload.payload, payload.provider_id);
        combined.positions.insert(combined.positions.end(),
                                  std::make_move_iterator(result.positions.begin()),
                                  std::make_move_iterator(result.positions.end()));
        append_warnings(combined.warnings, result.warnings);
    }

    return combined;
}

std::vector<std::string> NormalizerRegistry::formats() const {
    std::vector<std::string> formats;
    formats.reserve(normalizers_.size());
    for (const auto& [format, normalizer] : normalizers_) {
        formats.push_back(format);
    }
    std::sort(formats.begin(), formats.end());
    return formats;
}

}  // namespace holdings_ngin
