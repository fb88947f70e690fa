// include/holdings_ngin/consolidation/position_consolidator.hpp
#pragma once

#include <string>
#include <vector>
#include "holdings_ngin/consolidation/provider_priority_config.hpp"
#include "holdings_ngin/core/types.hpp"
#include "holdings_ngin/core/warning.hpp"

namespace holdings_ngin {

/**
 * @brief Output of a consolidation run
 */
struct ConsolidationResult {
    std::vector<CanonicalPosition> positions;  // cash groups first, then non-cash, first-seen order
    Warnings warnings;
};

/**
 * @brief Merges normalized positions from all providers into canonical positions
 *
 * Quantities of merged records are always summed. Provider priority only decides
 * which record supplies the metadata (account, cost basis, type hint, currency).
 * Records for the same ticker in different currencies are never merged: the
 * first-seen currency keeps the plain ticker and every other currency is kept
 * under "<ticker>__<CCY>".
 *
 * Stateless; safe to call concurrently.
 */
class PositionConsolidator {
public:
    /**
     * @param default_currency Currency assumed for records that carry none
     */
    explicit PositionConsolidator(std::string default_currency = "USD");

    ConsolidationResult consolidate(const std::vector<Position>& positions,
                                    const ProviderPriorityConfig& priorities) const;

    const std::string& default_currency() const {
        return default_currency_;
    }

private:
    std::string cash_currency_of(const Position& position) const;

    std::string default_currency_;
};

/**
 * @brief Turn consolidated output back into single-provider input
 * Used to re-ingest canonical positions; consolidating the result again is a no-op.
 */
std::vector<Position> to_positions(const std::vector<CanonicalPosition>& canonical,
                                   const std::string& provider_id);

}  // namespace holdings_ngin
