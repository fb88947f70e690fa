// include/holdings_ngin/classification/classification_entry.hpp
#pragma once

#include <chrono>
#include <string>
#include "holdings_ngin/core/types.hpp"

namespace holdings_ngin {

/**
 * @brief Tier that produced a classification
 */
enum class ClassificationTier { MEMORY, PERSISTENT, AUTHORITATIVE, HEURISTIC };

inline std::string classification_tier_to_string(ClassificationTier tier) {
    switch (tier) {
        case ClassificationTier::MEMORY:
            return "memory";
        case ClassificationTier::PERSISTENT:
            return "persistent";
        case ClassificationTier::AUTHORITATIVE:
            return "authoritative";
        case ClassificationTier::HEURISTIC:
            return "heuristic";
        default:
            return "unknown";
    }
}

/**
 * @brief Cached security type of one ticker
 * Always replaced whole, never updated field by field.
 */
struct ClassificationCacheEntry {
    std::string ticker;
    SecurityType security_type{SecurityType::UNKNOWN};
    ClassificationTier source_tier{ClassificationTier::HEURISTIC};
    Timestamp resolved_at{};
    std::chrono::seconds ttl{0};

    bool is_stale(Timestamp now) const {
        return now - resolved_at > ttl;
    }
};

/**
 * @brief Resolved type together with the tier that answered
 *
 * tier is the tier that answered this call; a memory hit reports MEMORY even if the
 * entry originally came from the authoritative tier (see origin).
 */
struct Classification {
    SecurityType type{SecurityType::UNKNOWN};
    ClassificationTier tier{ClassificationTier::HEURISTIC};
    ClassificationTier origin{ClassificationTier::HEURISTIC};
};

}  // namespace holdings_ngin
