#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "holdings_ngin/providers/schwab_normalizer.hpp"

using namespace holdings_ngin;
using namespace holdings_ngin::testing;

class SchwabNormalizerTest : public TestBase {
protected:
    SchwabNormalizer normalizer;

    nlohmann::json sample_payload() const {
        return nlohmann::json::parse(R"({
            "securitiesAccount": {
                "accountNumber": "12345678",
                "positions": [
                    {"longQuantity": 100, "shortQuantity": 0, "averagePrice": 120.5,
                     "marketValue": 14000.0,
                     "instrument": {"symbol": "AAPL", "assetType": "EQUITY"}},
                    {"longQuantity": 0, "shortQuantity": 20, "marketValue": -3000.0,
                     "instrument": {"symbol": "TSLA", "assetType": "EQUITY"}},
                    {"longQuantity": 50,
                     "instrument": {"symbol": "SWVXX", "assetType": "MUTUAL_FUND"}}
                ],
                "currentBalances": {"cashBalance": 2500.0}
            }
        })");
    }
};

TEST_F(SchwabNormalizerTest, NormalizesPositions) {
    auto result = normalizer.normalize(sample_payload(), "schwab");

    ASSERT_EQ(result.positions.size(), 4u);
    EXPECT_TRUE(result.warnings.empty());

    const auto& aapl = result.positions[0];
    EXPECT_EQ(aapl.ticker, "AAPL");
    EXPECT_DOUBLE_EQ(aapl.quantity, 100.0);
    EXPECT_EQ(aapl.currency, "USD");
    EXPECT_EQ(aapl.account_id, "12345678");
    EXPECT_EQ(aapl.security_type_hint, "equity");
    ASSERT_TRUE(aapl.cost_basis.has_value());
    EXPECT_DOUBLE_EQ(*aapl.cost_basis, 12050.0);

    EXPECT_EQ(result.positions[2].security_type_hint, "mutual_fund");
}

TEST_F(SchwabNormalizerTest, ShortQuantityIsNegative) {
    auto result = normalizer.normalize(sample_payload(), "schwab");
    ASSERT_GE(result.positions.size(), 2u);
    EXPECT_EQ(result.positions[1].ticker, "TSLA");
    EXPECT_DOUBLE_EQ(result.positions[1].quantity, -20.0);
}

TEST_F(SchwabNormalizerTest, CashBalanceBecomesUsdCash) {
    auto result = normalizer.normalize(sample_payload(), "schwab");
    ASSERT_EQ(result.positions.size(), 4u);
    EXPECT_EQ(result.positions[3].ticker, "CUR:USD");
    EXPECT_DOUBLE_EQ(result.positions[3].quantity, 2500.0);
}

TEST_F(SchwabNormalizerTest, PositionWithoutQuantityIsMalformed) {
    auto payload = sample_payload();
    payload["securitiesAccount"]["positions"].push_back(
        {{"instrument", {{"symbol", "IBM"}, {"assetType", "EQUITY"}}}});

    auto result = normalizer.normalize(payload, "schwab");
    EXPECT_EQ(result.positions.size(), 4u);
    ASSERT_EQ(count_warnings(result.warnings, WarningCode::MALFORMED_RECORD), 1u);
    EXPECT_EQ(result.warnings[0].ticker, "IBM");
}

TEST_F(SchwabNormalizerTest, MissingAccountIsMalformed) {
    auto result = normalizer.normalize(nlohmann::json::parse(R"({"accounts": []})"), "schwab");
    EXPECT_TRUE(result.positions.empty());
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::MALFORMED_RECORD), 1u);
}
