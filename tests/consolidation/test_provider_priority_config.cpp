#include <gtest/gtest.h>
#include "holdings_ngin/consolidation/provider_priority_config.hpp"

using namespace holdings_ngin;

TEST(ProviderPriorityConfigTest, DefaultsRankBrokersAboveAggregators) {
    ProviderPriorityConfig config;
    EXPECT_GT(config.priority_of("schwab"), config.priority_of("plaid"));
    EXPECT_GT(config.priority_of("snaptrade"), config.priority_of("plaid"));
    EXPECT_EQ(config.priority_of("unknown"), config.default_priority);
    EXPECT_TRUE(config.validate().empty());
}

TEST(ProviderPriorityConfigTest, JsonRoundTrip) {
    ProviderPriorityConfig config;
    config.priorities = {{"manual", 100}, {"plaid", 5}};
    config.default_priority = -1;

    ProviderPriorityConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.priorities, config.priorities);
    EXPECT_EQ(loaded.default_priority, -1);
    EXPECT_EQ(loaded.priority_of("manual"), 100);
}

TEST(ProviderPriorityConfigTest, EmptyProviderIdIsInvalid) {
    ProviderPriorityConfig config;
    config.priorities[""] = 1;
    EXPECT_FALSE(config.validate().empty());
}
