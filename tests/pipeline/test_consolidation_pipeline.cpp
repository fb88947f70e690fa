#include <gtest/gtest.h>
#include <future>
#include "../classification/test_fakes.hpp"
#include "../core/test_base.hpp"
#include "holdings_ngin/pipeline/consolidation_pipeline.hpp"

using namespace holdings_ngin;
using namespace holdings_ngin::testing;
using namespace std::chrono_literals;

class ConsolidationPipelineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<FakeClassificationStore>();
        authoritative = std::make_shared<FakeAuthoritativeClassifier>();
        config.classification.lookup_timeout = 200ms;
        config.classification.batch_timeout = 1000ms;
        config.retry.max_attempts = 1;
    }

    std::shared_ptr<ClassificationCache> make_cache() {
        return std::make_shared<ClassificationCache>(config.classification, store,
                                                     authoritative, config.retry);
    }

    std::unique_ptr<ConsolidationPipeline> make_pipeline() {
        auto pipeline = ConsolidationPipeline::create(config, make_cache());
        EXPECT_TRUE(pipeline.is_ok());
        return pipeline.take_value();
    }

    static ProviderPayload canonical_payload(const std::string& provider,
                                             const std::string& json) {
        return ProviderPayload{provider, "canonical", nlohmann::json::parse(json)};
    }

    static const AnnotatedPosition* find(const PipelineResult& result,
                                         const std::string& ticker) {
        for (const auto& p : result.positions) {
            if (p.position.ticker == ticker)
                return &p;
        }
        return nullptr;
    }

    std::shared_ptr<FakeClassificationStore> store;
    std::shared_ptr<FakeAuthoritativeClassifier> authoritative;
    PipelineConfig config;
};

TEST_F(ConsolidationPipelineTest, ConsolidatesClassifiesAndAnnotates) {
    authoritative->answer("ZZZ", etf_profile());
    authoritative->answer("AAPL", equity_profile());
    store->seed("DSU", SecurityType::MUTUAL_FUND, std::chrono::system_clock::now());
    auto pipeline = make_pipeline();

    std::vector<ProviderPayload> payloads{
        ProviderPayload{"schwab", "", nlohmann::json::parse(R"({
            "securitiesAccount": {
                "accountNumber": "S-1",
                "positions": [
                    {"longQuantity": 50, "averagePrice": 100.0,
                     "instrument": {"symbol": "AAPL", "assetType": "EQUITY"}},
                    {"longQuantity": 10, "instrument": {"symbol": "ZZZ", "assetType": "EQUITY"}}
                ],
                "currentBalances": {"cashBalance": 3000.0}
            }})")},
        canonical_payload("plaid", R"([
            {"ticker": "AAPL", "quantity": 100, "currency": "USD", "account_id": "P-1"},
            {"ticker": "DSU", "quantity": 200, "currency": "USD"},
            {"ticker": "CUR:USD", "quantity": 5000, "currency": "USD"}
        ])")};

    auto result = pipeline->run(payloads);

    ASSERT_EQ(result.positions.size(), 4u);
    EXPECT_TRUE(result.warnings.empty());

    const auto* cash = find(result, "CUR:USD");
    ASSERT_NE(cash, nullptr);
    EXPECT_DOUBLE_EQ(cash->position.quantity, 8000.0);
    EXPECT_EQ(cash->position.security_type, SecurityType::CASH);
    EXPECT_DOUBLE_EQ(cash->scenario.severity, 0.05);

    const auto* aapl = find(result, "AAPL");
    ASSERT_NE(aapl, nullptr);
    EXPECT_DOUBLE_EQ(aapl->position.quantity, 150.0);
    EXPECT_EQ(aapl->position.account_id, "S-1");
    EXPECT_EQ(aapl->position.position_source(), "plaid,schwab");
    EXPECT_EQ(aapl->scenario.name, "single_stock_crash");
    EXPECT_DOUBLE_EQ(aapl->scenario.severity, 0.80);

    const auto* zzz = find(result, "ZZZ");
    ASSERT_NE(zzz, nullptr);
    EXPECT_EQ(zzz->position.security_type, SecurityType::ETF);
    EXPECT_EQ(zzz->tier, ClassificationTier::AUTHORITATIVE);
    EXPECT_DOUBLE_EQ(zzz->scenario.severity, 0.35);
    EXPECT_TRUE(zzz->diversified);
    EXPECT_EQ(zzz->asset_class, "mixed");

    const auto* dsu = find(result, "DSU");
    ASSERT_NE(dsu, nullptr);
    EXPECT_EQ(dsu->position.security_type, SecurityType::MUTUAL_FUND);
    EXPECT_EQ(dsu->tier, ClassificationTier::PERSISTENT);
    EXPECT_DOUBLE_EQ(dsu->scenario.severity, 0.40);

    EXPECT_EQ(authoritative->calls_for("DSU"), 0);
}

TEST_F(ConsolidationPipelineTest, AuthoritativeTimeoutUsesHeuristicSeverity) {
    authoritative->set_delay(500ms);
    config.classification.lookup_timeout = 20ms;
    auto pipeline = make_pipeline();

    auto result = pipeline->run(
        {canonical_payload("manual", R"([{"ticker": "QQQ", "quantity": 5}])")});

    ASSERT_EQ(result.positions.size(), 1u);
    const auto& qqq = result.positions[0];
    EXPECT_EQ(qqq.position.security_type, SecurityType::EQUITY);
    EXPECT_EQ(qqq.tier, ClassificationTier::HEURISTIC);
    EXPECT_DOUBLE_EQ(qqq.scenario.severity, 0.80);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::AUTHORITATIVE_LOOKUP_TIMEOUT), 1u);
    EXPECT_FALSE(store->entry("QQQ").has_value());
}

TEST_F(ConsolidationPipelineTest, EmptyPayloadListIsEmptyResult) {
    auto pipeline = make_pipeline();

    auto result = pipeline->run({});

    EXPECT_TRUE(result.positions.empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, WarningCode::EMPTY_INPUT);
}

TEST_F(ConsolidationPipelineTest, OnlyMalformedRecordsIsEmptyResult) {
    auto pipeline = make_pipeline();

    auto result = pipeline->run({canonical_payload("manual", R"([{"ticker": "AAPL"}])")});

    EXPECT_TRUE(result.positions.empty());
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::MALFORMED_RECORD), 1u);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::EMPTY_INPUT), 1u);
}

TEST_F(ConsolidationPipelineTest, WarningsFromEveryStageAreCollected) {
    authoritative->answer("AAPL", equity_profile());
    auto pipeline = make_pipeline();

    std::vector<ProviderPayload> payloads{
        ProviderPayload{"robinhood", "", nlohmann::json::array()},
        canonical_payload("manual", R"([
            {"ticker": "AAPL", "quantity": 100, "currency": "USD"},
            {"ticker": "AAPL", "quantity": 20, "currency": "EUR"},
            {"quantity": 3}
        ])")};

    auto result = pipeline->run(payloads);

    ASSERT_EQ(result.positions.size(), 2u);
    EXPECT_NE(find(result, "AAPL__EUR"), nullptr);
    EXPECT_EQ(find(result, "AAPL__EUR")->position.security_type, SecurityType::EQUITY);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::UNKNOWN_PROVIDER), 1u);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::MIXED_CURRENCY_SAME_TICKER), 1u);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::MALFORMED_RECORD), 1u);
    EXPECT_EQ(authoritative->calls_for("AAPL"), 1);
}

TEST_F(ConsolidationPipelineTest, UnmappedTypeGetsEquityScenario) {
    auto pipeline = make_pipeline();

    auto result = pipeline->run({canonical_payload(
        "manual", R"([{"ticker": "T 4.5 05/15/34", "quantity": 10, "type": "bond"}])")});

    ASSERT_EQ(result.positions.size(), 1u);
    EXPECT_EQ(result.positions[0].position.security_type, SecurityType::BOND);
    EXPECT_DOUBLE_EQ(result.positions[0].scenario.severity, 0.80);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::UNMAPPED_SECURITY_TYPE), 1u);
}

TEST_F(ConsolidationPipelineTest, PriorityReloadAffectsLaterRunsOnly) {
    auto pipeline = make_pipeline();
    std::vector<ProviderPayload> payloads{
        canonical_payload("plaid", R"([{"ticker": "CUR:EUR", "quantity": 1},
                                      {"ticker": "MSFT", "quantity": 1, "account_id": "P"}])"),
        canonical_payload("schwab", R"([{"ticker": "MSFT", "quantity": 2, "account_id": "S"}])")};

    auto before = pipeline->priorities();
    auto first = pipeline->run(payloads);
    EXPECT_EQ(find(first, "MSFT")->position.account_id, "S");

    ProviderPriorityConfig reloaded;
    reloaded.priorities = {{"plaid", 100}, {"schwab", 1}};
    ASSERT_TRUE(pipeline->reload_priorities(reloaded).is_ok());

    auto second = pipeline->run(payloads);
    EXPECT_EQ(find(second, "MSFT")->position.account_id, "P");
    EXPECT_DOUBLE_EQ(find(second, "MSFT")->position.quantity, 3.0);

    // snapshots taken earlier are untouched
    EXPECT_EQ(before->priority_of("plaid"), 10);
    EXPECT_EQ(pipeline->priorities()->priority_of("plaid"), 100);
}

TEST_F(ConsolidationPipelineTest, InvalidPriorityReloadIsRejected) {
    auto pipeline = make_pipeline();
    ProviderPriorityConfig bad;
    bad.priorities[""] = 5;

    auto result = pipeline->reload_priorities(bad);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(pipeline->priorities()->priority_of("plaid"), 10);
}

TEST_F(ConsolidationPipelineTest, MissingCrashTableIsFatal) {
    config.crash_scenarios.scenarios.clear();
    config.crash_scenarios.type_to_scenario.clear();

    auto pipeline = ConsolidationPipeline::create(config, make_cache());
    ASSERT_TRUE(pipeline.is_error());
    EXPECT_EQ(pipeline.error()->code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(ConsolidationPipelineTest, ConfigFileWithoutCrashTableFailsValidation) {
    PipelineConfig loaded;
    loaded.from_json(nlohmann::json::parse(R"({"default_cash_currency": "USD"})"));
    EXPECT_FALSE(loaded.validate().empty());

    PipelineConfig full;
    full.from_json(config.to_json());
    EXPECT_TRUE(full.validate().empty());
}

TEST_F(ConsolidationPipelineTest, CacheIsRequired) {
    auto pipeline = ConsolidationPipeline::create(config, nullptr);
    ASSERT_TRUE(pipeline.is_error());
    EXPECT_EQ(pipeline.error()->code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(ConsolidationPipelineTest, RegistersWithStateManager) {
    std::string id;
    {
        auto pipeline = make_pipeline();
        id = pipeline->component_id();

        auto state = StateManager::instance().get_state(id);
        ASSERT_TRUE(state.is_ok());
        EXPECT_EQ(state.value().state, ComponentState::RUNNING);

        pipeline->run({canonical_payload("manual", R"([{"ticker": "CUR:USD", "quantity": 1}])")});
        auto after_run = StateManager::instance().get_state(id);
        ASSERT_TRUE(after_run.is_ok());
        EXPECT_DOUBLE_EQ(after_run.value().metrics.at("positions"), 1.0);
    }
    EXPECT_TRUE(StateManager::instance().get_state(id).is_error());
}

TEST_F(ConsolidationPipelineTest, ConcurrentRunsAreIndependent) {
    authoritative->answer("AAPL", equity_profile());
    authoritative->set_delay(50ms);
    auto pipeline = make_pipeline();
    auto payload = canonical_payload("manual", R"([{"ticker": "AAPL", "quantity": 1}])");

    std::vector<std::future<PipelineResult>> runs;
    for (int i = 0; i < 4; ++i) {
        runs.push_back(std::async(std::launch::async, [&pipeline, &payload] {
            return pipeline->run({payload});
        }));
    }
    for (auto& run : runs) {
        auto result = run.get();
        ASSERT_EQ(result.positions.size(), 1u);
        EXPECT_DOUBLE_EQ(result.positions[0].position.quantity, 1.0);
    }
    EXPECT_EQ(authoritative->calls_for("AAPL"), 1);
}

TEST_F(ConsolidationPipelineTest, ResultSerializesToJson) {
    auto pipeline = make_pipeline();
    auto result = pipeline->run(
        {canonical_payload("manual", R"([{"ticker": "SWVXX", "quantity": 10}])")});

    auto j = result.to_json();
    ASSERT_EQ(j["positions"].size(), 1u);
    const auto& position = j["positions"][0];
    EXPECT_EQ(position["ticker"], "SWVXX");
    EXPECT_EQ(position["security_type"], "cash");
    EXPECT_EQ(position["classification_tier"], "heuristic");
    EXPECT_EQ(position["crash_scenario"], "cash_crash");
    EXPECT_EQ(position["position_source"], "manual");
    EXPECT_TRUE(position["cost_basis"].is_null());
}

TEST_F(ConsolidationPipelineTest, HeuristicOnlyCacheFromConfig) {
    config.authoritative_enabled = false;
    config.database_connection_string.clear();

    auto cache = make_classification_cache(config);
    ASSERT_TRUE(cache.is_ok());
    auto pipeline = ConsolidationPipeline::create(config, cache.value());
    ASSERT_TRUE(pipeline.is_ok());

    auto result = pipeline.value()->run(
        {canonical_payload("manual", R"([{"ticker": "VFIAX", "quantity": 3}])")});
    ASSERT_EQ(result.positions.size(), 1u);
    EXPECT_EQ(result.positions[0].position.security_type, SecurityType::MUTUAL_FUND);
    EXPECT_TRUE(result.warnings.empty());
}
