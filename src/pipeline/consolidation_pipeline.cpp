// src/pipeline/consolidation_pipeline.cpp
#include "holdings_ngin/pipeline/consolidation_pipeline.hpp"
#include <unordered_set>
#include "holdings_ngin/classification/fmp_classifier.hpp"
#include "holdings_ngin/classification/postgres_classification_store.hpp"
#include "holdings_ngin/core/logger.hpp"
#include "holdings_ngin/core/state_manager.hpp"

namespace holdings_ngin {

nlohmann::json AnnotatedPosition::to_json() const {
    nlohmann::json j;
    j["ticker"] = position.ticker;
    j["quantity"] = position.quantity;
    j["currency"] = position.currency;
    j["security_type"] = security_type_to_string(position.security_type);
    j["asset_class"] = asset_class;
    j["diversified"] = diversified;
    j["is_cash"] = position.is_cash;
    j["account_id"] = position.account_id;
    j["cost_basis"] = position.cost_basis ? nlohmann::json(*position.cost_basis) : nlohmann::json();
    j["value"] = position.market_value ? nlohmann::json(*position.market_value) : nlohmann::json();
    j["contributing_providers"] = position.contributing_providers;
    j["position_source"] = position.position_source();
    j["classification_tier"] = classification_tier_to_string(tier);
    j["crash_scenario"] = scenario.name;
    j["crash_severity"] = scenario.severity;
    return j;
}

nlohmann::json PipelineResult::to_json() const {
    nlohmann::json j;
    j["positions"] = nlohmann::json::array();
    for (const auto& position : positions) {
        j["positions"].push_back(position.to_json());
    }
    j["warnings"] = nlohmann::json::array();
    for (const auto& warning : warnings) {
        j["warnings"].push_back(warning.to_json());
    }
    return j;
}

Result<std::unique_ptr<ConsolidationPipeline>> ConsolidationPipeline::create(
    const PipelineConfig& config, std::shared_ptr<ClassificationCache> cache,
    NormalizerRegistry registry) {
    using ReturnType = std::unique_ptr<ConsolidationPipeline>;

    auto validation = to_result(config.validate(), "ConsolidationPipeline");
    if (validation.is_error()) {
        FATAL("Pipeline configuration rejected: " << validation.error()->what());
        return make_error<ReturnType>(validation.error()->code(), validation.error()->what(),
                                      "ConsolidationPipeline");
    }
    if (!cache) {
        return make_error<ReturnType>(ErrorCode::INVALID_CONFIGURATION,
                                      "Classification cache is required",
                                      "ConsolidationPipeline");
    }

    auto mapper = CrashScenarioMapper::create(config.crash_scenarios);
    if (mapper.is_error()) {
        return make_error<ReturnType>(mapper.error()->code(), mapper.error()->what(),
                                      "ConsolidationPipeline");
    }

    auto priorities = std::make_shared<const ProviderPriorityConfig>(config.provider_priorities);
    return ReturnType(new ConsolidationPipeline(config.default_cash_currency, std::move(cache),
                                                mapper.value(), std::move(priorities),
                                                std::move(registry)));
}

ConsolidationPipeline::ConsolidationPipeline(
    std::string default_cash_currency, std::shared_ptr<ClassificationCache> cache,
    std::shared_ptr<const CrashScenarioMapper> mapper,
    std::shared_ptr<const ProviderPriorityConfig> priorities, NormalizerRegistry registry)
    : registry_(std::move(registry)),
      consolidator_(std::move(default_cash_currency)),
      cache_(std::move(cache)),
      mapper_(std::move(mapper)),
      priorities_(std::move(priorities)),
      component_id_(StateManager::next_component_id("PIPELINE")) {
    Logger::register_component("ConsolidationPipeline");

    ComponentInfo info{ComponentType::PIPELINE,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register pipeline with StateManager: " << registered.error()->what());
    } else {
        (void)StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    }
    INFO("Consolidation pipeline " << component_id_ << " ready");
}

ConsolidationPipeline::~ConsolidationPipeline() {
    (void)StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
    (void)StateManager::instance().unregister_component(component_id_);
}

std::shared_ptr<const ProviderPriorityConfig> ConsolidationPipeline::priorities() const {
    std::lock_guard<std::mutex> lock(priorities_mutex_);
    return priorities_;
}

Result<void> ConsolidationPipeline::reload_priorities(ProviderPriorityConfig priorities) {
    auto validation = to_result(priorities.validate(), "ConsolidationPipeline");
    if (validation.is_error()) {
        return validation;
    }

    auto snapshot = std::make_shared<const ProviderPriorityConfig>(std::move(priorities));
    {
        std::lock_guard<std::mutex> lock(priorities_mutex_);
        priorities_ = std::move(snapshot);
    }
    INFO("Provider priorities reloaded");
    return Result<void>();
}

PipelineResult ConsolidationPipeline::run(const std::vector<ProviderPayload>& payloads) {
    PipelineResult result;

    if (payloads.empty()) {
        WARN("EmptyInput: no provider payloads supplied");
        result.warnings.push_back(
            Warning{WarningCode::EMPTY_INPUT, "No provider payloads supplied", "", ""});
        return result;
    }

    // copy-on-read: later reloads do not affect this run
    const auto priorities = this->priorities();

    auto normalized = registry_.normalize_all(payloads);
    append_warnings(result.warnings, normalized.warnings);

    auto consolidated = consolidator_.consolidate(normalized.positions, *priorities);
    append_warnings(result.warnings, consolidated.warnings);

    if (consolidated.positions.empty()) {
        WARN("EmptyInput: payloads contained no usable positions");
        result.warnings.push_back(Warning{WarningCode::EMPTY_INPUT,
                                          "Payloads contained no usable positions", "", ""});
        return result;
    }

    // One batched resolution over distinct base tickers; cash needs no lookup
    std::vector<std::string> tickers;
    ClassificationCache::Hints hints;
    std::unordered_set<std::string> seen;
    for (const auto& position : consolidated.positions) {
        if (position.is_cash)
            continue;
        auto base = position.base_ticker();
        if (seen.insert(base).second) {
            tickers.push_back(base);
            if (!position.security_type_hint.empty())
                hints.emplace(base, position.security_type_hint);
        }
    }

    ResolutionResult resolution;
    if (!tickers.empty()) {
        resolution = cache_->resolve(tickers, hints);
        append_warnings(result.warnings, resolution.warnings);
    }

    result.positions.reserve(consolidated.positions.size());
    for (auto& position : consolidated.positions) {
        AnnotatedPosition annotated;
        if (position.is_cash) {
            position.security_type = SecurityType::CASH;
            annotated.tier = ClassificationTier::HEURISTIC;
        } else {
            auto it = resolution.classifications.find(position.base_ticker());
            if (it != resolution.classifications.end()) {
                position.security_type = it->second.type;
                annotated.tier = it->second.tier;
            } else {
                position.security_type = SecurityType::EQUITY;
                annotated.tier = ClassificationTier::HEURISTIC;
            }
        }

        const auto type_name = security_type_to_string(position.security_type);
        if (!mapper_->has_mapping(type_name)) {
            WARN("UnmappedSecurityType: " << position.ticker << " is " << type_name
                                          << ", using equity crash scenario");
            result.warnings.push_back(Warning{
                WarningCode::UNMAPPED_SECURITY_TYPE,
                "No crash scenario for type '" + type_name + "', using equity scenario",
                position.ticker, ""});
        }
        annotated.scenario = mapper_->map_to_scenario(position.security_type);
        annotated.asset_class = security_type_to_asset_class(position.security_type);
        annotated.diversified = is_diversified(position.security_type);
        annotated.position = std::move(position);
        result.positions.push_back(std::move(annotated));
    }

    auto metrics = cache_->stats().to_metrics();
    metrics["positions"] = static_cast<double>(result.positions.size());
    metrics["warnings"] = static_cast<double>(result.warnings.size());
    (void)StateManager::instance().update_metrics(component_id_, metrics);

    INFO("Pipeline run: " << payloads.size() << " payloads, " << normalized.positions.size()
                          << " positions -> " << result.positions.size() << " canonical, "
                          << result.warnings.size() << " warnings");
    return result;
}

Result<std::shared_ptr<ClassificationCache>> make_classification_cache(
    const PipelineConfig& config) {
    using ReturnType = std::shared_ptr<ClassificationCache>;

    auto validation = to_result(config.classification.validate(), "ClassificationCache");
    if (validation.is_error()) {
        return make_error<ReturnType>(validation.error()->code(), validation.error()->what(),
                                      "ClassificationCache");
    }

    std::shared_ptr<ClassificationStore> store;
    if (!config.database_connection_string.empty()) {
        auto postgres = std::make_shared<PostgresClassificationStore>(
            config.database_connection_string, config.classification_table);
        auto connected = postgres->connect();
        if (connected.is_error()) {
            if (connected.error()->code() == ErrorCode::INVALID_ARGUMENT) {
                return make_error<ReturnType>(ErrorCode::INVALID_CONFIGURATION,
                                              connected.error()->what(), "ClassificationCache");
            }
            WARN("Classification store unavailable at startup: " << connected.error()->what());
        }
        store = std::move(postgres);
    }

    std::shared_ptr<AuthoritativeClassifier> authoritative;
    if (config.authoritative_enabled) {
        if (config.fmp.resolved_api_key().empty()) {
            WARN("FMP API key not configured, authoritative tier disabled");
        } else {
            authoritative = std::make_shared<FmpClassifier>(config.fmp);
        }
    }

    return std::make_shared<ClassificationCache>(config.classification, std::move(store),
                                                 std::move(authoritative), config.retry);
}

}  // namespace holdings_ngin
