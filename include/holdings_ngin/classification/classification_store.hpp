// include/holdings_ngin/classification/classification_store.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "holdings_ngin/classification/classification_entry.hpp"
#include "holdings_ngin/core/error.hpp"

namespace holdings_ngin {

/**
 * @brief Durable ticker -> classification store
 *
 * Implementations serialize their own access. CONNECTION_ERROR and DATABASE_ERROR
 * mean the store is unavailable; the cache then skips the persistent tier.
 */
class ClassificationStore {
public:
    virtual ~ClassificationStore() = default;

    /**
     * @brief Fetch the entry for a ticker
     * @return The entry, std::nullopt on a miss, or an error
     */
    virtual Result<std::optional<ClassificationCacheEntry>> get(const std::string& ticker) = 0;

    /**
     * @brief Insert or replace the entry for entry.ticker in one atomic write
     */
    virtual Result<void> put(const ClassificationCacheEntry& entry) = 0;

    /**
     * @brief Tickers whose entry was resolved more than max_age before now
     */
    virtual Result<std::vector<std::string>> list_stale(std::chrono::seconds max_age,
                                                        Timestamp now) = 0;
};

}  // namespace holdings_ngin
