// include/holdings_ngin/pipeline/consolidation_pipeline.hpp
#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "holdings_ngin/classification/classification_cache.hpp"
#include "holdings_ngin/consolidation/position_consolidator.hpp"
#include "holdings_ngin/core/error.hpp"
#include "holdings_ngin/pipeline/pipeline_config.hpp"
#include "holdings_ngin/providers/normalizer_registry.hpp"
#include "holdings_ngin/risk/crash_scenario_mapper.hpp"

namespace holdings_ngin {

/**
 * @brief Canonical position with its classification and risk parameter
 */
struct AnnotatedPosition {
    CanonicalPosition position;
    CrashScenario scenario;
    ClassificationTier tier{ClassificationTier::HEURISTIC};
    std::string asset_class;
    bool diversified{false};

    nlohmann::json to_json() const;
};

struct PipelineResult {
    std::vector<AnnotatedPosition> positions;
    Warnings warnings;

    nlohmann::json to_json() const;
};

/**
 * @brief normalize -> consolidate -> classify -> annotate
 *
 * run() is safe to call concurrently. Provider priorities are an immutable snapshot
 * taken at the start of each run, so reload_priorities() only affects later runs.
 */
class ConsolidationPipeline {
public:
    /**
     * @brief Validate configuration and build a pipeline
     * @return INVALID_CONFIGURATION for a malformed configuration
     */
    static Result<std::unique_ptr<ConsolidationPipeline>> create(
        const PipelineConfig& config, std::shared_ptr<ClassificationCache> cache,
        NormalizerRegistry registry = NormalizerRegistry::with_defaults());

    ~ConsolidationPipeline();

    ConsolidationPipeline(const ConsolidationPipeline&) = delete;
    ConsolidationPipeline& operator=(const ConsolidationPipeline&) = delete;

    PipelineResult run(const std::vector<ProviderPayload>& payloads);

    /**
     * @brief Replace the provider priority snapshot for subsequent runs
     */
    Result<void> reload_priorities(ProviderPriorityConfig priorities);

    std::shared_ptr<const ProviderPriorityConfig> priorities() const;

    const std::string& component_id() const {
        return component_id_;
    }

private:
    ConsolidationPipeline(std::string default_cash_currency,
                          std::shared_ptr<ClassificationCache> cache,
                          std::shared_ptr<const CrashScenarioMapper> mapper,
                          std::shared_ptr<const ProviderPriorityConfig> priorities,
                          NormalizerRegistry registry);

    NormalizerRegistry registry_;
    PositionConsolidator consolidator_;
    std::shared_ptr<ClassificationCache> cache_;
    std::shared_ptr<const CrashScenarioMapper> mapper_;

    mutable std::mutex priorities_mutex_;
    std::shared_ptr<const ProviderPriorityConfig> priorities_;

    std::string component_id_;
};

/**
 * @brief Classification cache wired to the stores named in the configuration
 *
 * Postgres is used when a connection string is set; a failed connection leaves the
 * persistent tier reporting unavailable rather than failing startup. The FMP tier is
 * used when enabled and an API key is available.
 */
Result<std::shared_ptr<ClassificationCache>> make_classification_cache(
    const PipelineConfig& config);

}  // namespace holdings_ngin
