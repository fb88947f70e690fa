// include/holdings_ngin/providers/provider_normalizer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "holdings_ngin/core/types.hpp"
#include "holdings_ngin/core/warning.hpp"

namespace holdings_ngin {

/**
 * @brief Raw holdings payload from one upstream provider
 */
struct ProviderPayload {
    std::string provider_id;  // identity used for priority and audit, e.g. "schwab"
    std::string format;       // normalizer to use; defaults to provider_id when empty
    nlohmann::json payload;

    const std::string& effective_format() const {
        return format.empty() ? provider_id : format;
    }
};

/**
 * @brief Output of a normalizer
 */
struct NormalizationResult {
    std::vector<Position> positions;
    Warnings warnings;
};

/**
 * @brief Converts one provider's raw payload into canonical Position records
 *
 * Implementations are stateless. Records without a usable ticker or quantity are
 * dropped with a MALFORMED_RECORD warning; the rest of the batch is unaffected.
 */
class ProviderNormalizer {
public:
    virtual ~ProviderNormalizer() = default;

    /**
     * @brief Payload format handled by this normalizer, e.g. "plaid"
     */
    virtual std::string format() const = 0;

    /**
     * @brief Normalize a raw payload
     * @param payload Provider payload
     * @param provider_id Provider identity stamped on every position
     * @return Normalized positions and warnings; never throws
     */
    NormalizationResult normalize(const nlohmann::json& payload,
                                  const std::string& provider_id) const;

protected:
    virtual void do_normalize(const nlohmann::json& payload, const std::string& provider_id,
                              NormalizationResult& out) const = 0;

    /**
     * @brief Validate and append a position; drops it with a warning if unusable
     * @param record_desc Short description of the source record for the warning
     * @return true if the position was kept
     */
    static bool emit(NormalizationResult& out, Position position, const std::string& record_desc);

    static void add_malformed(NormalizationResult& out, const std::string& provider_id,
                              const std::string& message, const std::string& ticker = "");

    /**
     * @brief Position for a cash balance, keyed CUR:<currency>
     */
    static Position make_cash_position(const std::string& currency, Quantity amount,
                                       const std::string& account_id,
                                       const std::string& provider_id);
};

}  // namespace holdings_ngin
