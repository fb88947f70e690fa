#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "holdings_ngin/risk/crash_scenario_mapper.hpp"

using namespace holdings_ngin;
using namespace holdings_ngin::testing;

class CrashScenarioMapperTest : public TestBase {
protected:
    std::shared_ptr<const CrashScenarioMapper> default_mapper() {
        auto mapper = CrashScenarioMapper::create(CrashScenarioConfig());
        EXPECT_TRUE(mapper.is_ok());
        return mapper.value();
    }
};

TEST_F(CrashScenarioMapperTest, DefaultSeverities) {
    auto mapper = default_mapper();

    EXPECT_DOUBLE_EQ(mapper->map_to_scenario(SecurityType::EQUITY).severity, 0.80);
    EXPECT_DOUBLE_EQ(mapper->map_to_scenario(SecurityType::ETF).severity, 0.35);
    EXPECT_DOUBLE_EQ(mapper->map_to_scenario(SecurityType::MUTUAL_FUND).severity, 0.40);
    EXPECT_DOUBLE_EQ(mapper->map_to_scenario(SecurityType::CASH).severity, 0.05);
    EXPECT_EQ(mapper->map_to_scenario(SecurityType::ETF).name, "etf_crash");
}

TEST_F(CrashScenarioMapperTest, UnmappedTypesUseEquityScenario) {
    auto mapper = default_mapper();
    auto equity = mapper->map_to_scenario(SecurityType::EQUITY);

    for (auto type : {SecurityType::BOND, SecurityType::CRYPTO, SecurityType::DERIVATIVE,
                      SecurityType::UNKNOWN}) {
        auto scenario = mapper->map_to_scenario(type);
        EXPECT_EQ(scenario.name, equity.name);
        EXPECT_DOUBLE_EQ(scenario.severity, equity.severity);
    }
    EXPECT_EQ(mapper->map_to_scenario("not_a_type").name, "single_stock_crash");
    EXPECT_FALSE(mapper->has_mapping("bond"));
    EXPECT_TRUE(mapper->has_mapping("etf"));
}

TEST_F(CrashScenarioMapperTest, CustomTable) {
    CrashScenarioConfig config;
    config.scenarios["credit_event"] = 0.25;
    config.type_to_scenario["bond"] = "credit_event";

    auto mapper = CrashScenarioMapper::create(config);
    ASSERT_TRUE(mapper.is_ok());
    EXPECT_DOUBLE_EQ(mapper.value()->map_to_scenario(SecurityType::BOND).severity, 0.25);
    EXPECT_TRUE(mapper.value()->has_mapping("bond"));
}

TEST_F(CrashScenarioMapperTest, EmptyTableIsRejected) {
    CrashScenarioConfig config;
    config.scenarios.clear();
    config.type_to_scenario.clear();

    auto mapper = CrashScenarioMapper::create(config);
    ASSERT_TRUE(mapper.is_error());
    EXPECT_EQ(mapper.error()->code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(CrashScenarioMapperTest, InvalidEntriesAreRejected) {
    CrashScenarioConfig out_of_range;
    out_of_range.scenarios["etf_crash"] = 1.5;
    EXPECT_TRUE(CrashScenarioMapper::create(out_of_range).is_error());

    CrashScenarioConfig dangling;
    dangling.type_to_scenario["bond"] = "missing_scenario";
    EXPECT_TRUE(CrashScenarioMapper::create(dangling).is_error());

    CrashScenarioConfig unknown_type;
    unknown_type.type_to_scenario["stonk"] = "etf_crash";
    EXPECT_TRUE(CrashScenarioMapper::create(unknown_type).is_error());

    CrashScenarioConfig no_equity;
    no_equity.type_to_scenario.erase("equity");
    EXPECT_TRUE(CrashScenarioMapper::create(no_equity).is_error());
}

TEST_F(CrashScenarioMapperTest, ConfigRoundTrip) {
    CrashScenarioConfig config;
    config.scenarios["credit_event"] = 0.25;
    config.type_to_scenario["bond"] = "credit_event";

    CrashScenarioConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.scenarios, config.scenarios);
    EXPECT_EQ(loaded.type_to_scenario, config.type_to_scenario);
}
