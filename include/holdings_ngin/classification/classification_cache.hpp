// include/holdings_ngin/classification/classification_cache.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "holdings_ngin/classification/authoritative_classifier.hpp"
#include "holdings_ngin/classification/classification_entry.hpp"
#include "holdings_ngin/classification/classification_store.hpp"
#include "holdings_ngin/classification/retry_policy.hpp"
#include "holdings_ngin/core/config_base.hpp"
#include "holdings_ngin/core/warning.hpp"

namespace holdings_ngin {

/**
 * @brief Configuration for the tiered classification cache
 */
struct ClassificationCacheConfig : public ConfigBase {
    size_t memory_capacity{10000};
    std::chrono::seconds authoritative_ttl{std::chrono::hours(24 * 90)};
    // Provisional answers only need to outlive one run
    std::chrono::seconds heuristic_ttl{std::chrono::minutes(2)};
    size_t max_concurrent_lookups{8};
    std::chrono::milliseconds lookup_timeout{std::chrono::milliseconds(5000)};
    std::chrono::milliseconds batch_timeout{std::chrono::milliseconds(30000)};

    // How long destruction waits for authoritative calls still running
    std::chrono::milliseconds shutdown_grace{std::chrono::milliseconds(2000)};

    std::vector<ConfigValidationError> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Output of a batch resolution
 */
struct ResolutionResult {
    std::unordered_map<std::string, Classification> classifications;
    Warnings warnings;
};

/**
 * @brief Per-tier counters since construction
 */
struct CacheStats {
    uint64_t memory_hits{0};
    uint64_t persistent_hits{0};
    uint64_t authoritative_hits{0};
    uint64_t heuristic_hits{0};
    uint64_t authoritative_calls{0};
    uint64_t authoritative_timeouts{0};
    uint64_t authoritative_failures{0};
    uint64_t store_errors{0};
    size_t memory_size{0};

    nlohmann::json to_json() const;
    std::unordered_map<std::string, double> to_metrics() const;
};

/**
 * @brief Resolves tickers to security types through memory, persistent,
 * authoritative and heuristic tiers
 *
 * A ticker stops at the first tier with a fresh answer. Authoritative calls run on
 * detached worker threads limited by max_concurrent_lookups, share one call per
 * ticker across concurrent callers, and are abandoned by the caller after
 * lookup_timeout. A call that succeeds after being abandoned still writes its result
 * through. Heuristic answers are kept in memory for heuristic_ttl and never persisted;
 * a memory hit on one reports origin HEURISTIC.
 *
 * Thread-safe. store and authoritative may be null, which disables that tier.
 */
class ClassificationCache {
public:
    using Clock = std::function<Timestamp()>;
    using Hints = std::unordered_map<std::string, std::string>;

    /**
     * @brief Starts an authoritative worker; the default runs it on a detached thread
     * A spawner that throws leaves the ticker to the heuristic tier with a failure warning.
     */
    using Spawner = std::function<void(std::function<void()>)>;

    ClassificationCache(ClassificationCacheConfig config,
                        std::shared_ptr<ClassificationStore> store,
                        std::shared_ptr<AuthoritativeClassifier> authoritative,
                        RetryPolicy retry = RetryPolicy(), Clock clock = Clock(),
                        Spawner spawner = Spawner());

    ~ClassificationCache();

    ClassificationCache(const ClassificationCache&) = delete;
    ClassificationCache& operator=(const ClassificationCache&) = delete;

    ResolutionResult resolve(const std::vector<std::string>& tickers);

    /**
     * @brief Resolve with provider type hints (ticker -> hint) for the heuristic tier
     */
    ResolutionResult resolve(const std::vector<std::string>& tickers, const Hints& hints);

    /**
     * @brief Drop memory entries and re-resolve from the authoritative tier
     * Tickers the authoritative tier cannot answer fall back to the heuristic.
     */
    ResolutionResult force_refresh(const std::vector<std::string>& tickers);

    /**
     * @brief Force-refresh every persisted ticker resolved more than max_age ago
     * @return Error when the persistent store is missing or unavailable
     */
    Result<ResolutionResult> refresh_stale(std::chrono::seconds max_age);

    /**
     * @brief Drop the memory entry for a ticker
     * @return true if an entry was present
     */
    bool invalidate(const std::string& ticker);

    CacheStats stats() const;

    /**
     * @brief Memory entry for a ticker without counting an access
     */
    std::optional<ClassificationCacheEntry> memory_entry(const std::string& ticker) const;

    const ClassificationCacheConfig& config() const;

private:
    struct State;

    ResolutionResult resolve_impl(const std::vector<std::string>& tickers, const Hints& hints,
                                  bool bypass_caches);

    std::shared_ptr<State> state_;
};

}  // namespace holdings_ngin
