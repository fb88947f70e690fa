#include <gtest/gtest.h>
#include <cmath>
#include <map>
#include "../core/test_base.hpp"
#include "holdings_ngin/consolidation/position_consolidator.hpp"

using namespace holdings_ngin;
using namespace holdings_ngin::testing;

class PositionConsolidatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        priorities.priorities = {{"low", 10}, {"high", 50}, {"peer_a", 20}, {"peer_b", 20}};
    }

    static Position make_position(const std::string& ticker, double quantity,
                                  const std::string& currency, const std::string& provider,
                                  const std::string& account = "", double cost_basis = 0.0) {
        Position p(ticker, quantity, currency, provider);
        p.account_id = account;
        if (cost_basis != 0.0)
            p.cost_basis = cost_basis;
        return p;
    }

    static const CanonicalPosition* find(const ConsolidationResult& result,
                                         const std::string& ticker) {
        for (const auto& p : result.positions) {
            if (p.ticker == ticker)
                return &p;
        }
        return nullptr;
    }

    PositionConsolidator consolidator;
    ProviderPriorityConfig priorities;
};

TEST_F(PositionConsolidatorTest, HigherPriorityProviderSuppliesMetadata) {
    std::vector<Position> input{
        make_position("AAPL", 100, "USD", "low", "acct-low", 12000.0),
        make_position("AAPL", 50, "USD", "high", "acct-high", 7000.0)};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 1u);
    EXPECT_TRUE(result.warnings.empty());
    const auto& aapl = result.positions[0];
    EXPECT_EQ(aapl.ticker, "AAPL");
    EXPECT_DOUBLE_EQ(aapl.quantity, 150.0);
    EXPECT_EQ(aapl.currency, "USD");
    EXPECT_EQ(aapl.account_id, "acct-high");
    EXPECT_DOUBLE_EQ(*aapl.cost_basis, 7000.0);
    EXPECT_EQ(aapl.position_source(), "high,low");
}

TEST_F(PositionConsolidatorTest, DifferentCurrenciesAreNeverMerged) {
    std::vector<Position> input{make_position("AAPL", 100, "USD", "low"),
                                make_position("AAPL", 20, "EUR", "high")};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 2u);
    const auto* usd = find(result, "AAPL");
    const auto* eur = find(result, "AAPL__EUR");
    ASSERT_NE(usd, nullptr);
    ASSERT_NE(eur, nullptr);
    EXPECT_DOUBLE_EQ(usd->quantity, 100.0);
    EXPECT_EQ(usd->currency, "USD");
    EXPECT_DOUBLE_EQ(eur->quantity, 20.0);
    EXPECT_EQ(eur->currency, "EUR");
    EXPECT_EQ(eur->base_ticker(), "AAPL");

    ASSERT_EQ(count_warnings(result.warnings, WarningCode::MIXED_CURRENCY_SAME_TICKER), 1u);
    EXPECT_EQ(result.warnings[0].ticker, "AAPL");
}

TEST_F(PositionConsolidatorTest, ConflictWarnedOncePerCurrency) {
    std::vector<Position> input{
        make_position("SHEL", 10, "GBP", "low"), make_position("SHEL", 5, "EUR", "low"),
        make_position("SHEL", 7, "EUR", "high"), make_position("SHEL", 3, "USD", "high")};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 3u);
    EXPECT_DOUBLE_EQ(find(result, "SHEL")->quantity, 10.0);
    EXPECT_DOUBLE_EQ(find(result, "SHEL__EUR")->quantity, 12.0);
    EXPECT_DOUBLE_EQ(find(result, "SHEL__USD")->quantity, 3.0);
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::MIXED_CURRENCY_SAME_TICKER), 2u);
}

TEST_F(PositionConsolidatorTest, CashSumsRegardlessOfPriority) {
    std::vector<Position> input{make_position("CUR:USD", 5000, "USD", "low"),
                                make_position("CUR:USD", 3000, "USD", "high")};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 1u);
    const auto& cash = result.positions[0];
    EXPECT_EQ(cash.ticker, "CUR:USD");
    EXPECT_DOUBLE_EQ(cash.quantity, 8000.0);
    EXPECT_TRUE(cash.is_cash);
    EXPECT_EQ(cash.security_type, SecurityType::CASH);
}

TEST_F(PositionConsolidatorTest, CashHintJoinsCurrencyGroup) {
    auto sweep = make_position("SWEEP", 250, "usd", "low");
    sweep.security_type_hint = "cash";
    std::vector<Position> input{make_position("CUR:USD", 100, "USD", "high"), sweep,
                                make_position("CUR:EUR", 40, "", "high")};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 2u);
    EXPECT_DOUBLE_EQ(find(result, "CUR:USD")->quantity, 350.0);
    EXPECT_EQ(find(result, "CUR:EUR")->currency, "EUR");
}

TEST_F(PositionConsolidatorTest, CashPrecedesSecuritiesInFirstSeenOrder) {
    std::vector<Position> input{
        make_position("MSFT", 1, "USD", "low"), make_position("CUR:EUR", 10, "EUR", "low"),
        make_position("AAPL", 2, "USD", "low"), make_position("CUR:USD", 20, "USD", "low"),
        make_position("MSFT", 3, "USD", "high")};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 4u);
    EXPECT_EQ(result.positions[0].ticker, "CUR:EUR");
    EXPECT_EQ(result.positions[1].ticker, "CUR:USD");
    EXPECT_EQ(result.positions[2].ticker, "MSFT");
    EXPECT_EQ(result.positions[3].ticker, "AAPL");
}

TEST_F(PositionConsolidatorTest, TieKeepsFirstSeenMetadata) {
    std::vector<Position> input{make_position("NVDA", 4, "USD", "peer_b", "acct-b"),
                                make_position("NVDA", 6, "USD", "peer_a", "acct-a")};

    for (int run = 0; run < 5; ++run) {
        auto result = consolidator.consolidate(input, priorities);
        ASSERT_EQ(result.positions.size(), 1u);
        EXPECT_EQ(result.positions[0].account_id, "acct-b");
        EXPECT_DOUBLE_EQ(result.positions[0].quantity, 10.0);
    }
}

TEST_F(PositionConsolidatorTest, UnlistedProviderUsesDefaultPriority) {
    std::vector<Position> input{make_position("IBM", 1, "USD", "unlisted", "acct-x"),
                                make_position("IBM", 1, "USD", "low", "acct-low")};

    auto result = consolidator.consolidate(input, priorities);
    ASSERT_EQ(result.positions.size(), 1u);
    EXPECT_EQ(result.positions[0].account_id, "acct-low");
}

TEST_F(PositionConsolidatorTest, MissingCurrencyUsesDefault) {
    std::vector<Position> input{make_position("AMD", 5, "", "low"),
                                make_position("amd", 5, "usd", "high")};

    auto result = consolidator.consolidate(input, priorities);
    ASSERT_EQ(result.positions.size(), 1u);
    EXPECT_EQ(result.positions[0].currency, "USD");
    EXPECT_DOUBLE_EQ(result.positions[0].quantity, 10.0);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(PositionConsolidatorTest, MalformedRecordsAreSkippedNotZeroed) {
    std::vector<Position> input{make_position("", 10, "USD", "low"),
                                make_position("GOOG", std::nan(""), "USD", "low"),
                                make_position("GOOG", 2, "USD", "high")};

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), 1u);
    EXPECT_DOUBLE_EQ(result.positions[0].quantity, 2.0);
    EXPECT_EQ(result.positions[0].position_source(), "high");
    EXPECT_EQ(count_warnings(result.warnings, WarningCode::MALFORMED_RECORD), 2u);
}

TEST_F(PositionConsolidatorTest, MarketValueSummedWhenKnown) {
    auto a = make_position("V", 2, "USD", "low");
    a.market_value = 500.0;
    auto b = make_position("V", 1, "USD", "high");
    auto c = make_position("V", 1, "USD", "high");
    c.market_value = 250.0;

    auto result = consolidator.consolidate({a, b, c}, priorities);
    ASSERT_EQ(result.positions.size(), 1u);
    ASSERT_TRUE(result.positions[0].market_value.has_value());
    EXPECT_DOUBLE_EQ(*result.positions[0].market_value, 750.0);
}

TEST_F(PositionConsolidatorTest, QuantityIsConservedPerTickerAndCurrency) {
    std::vector<Position> input;
    std::map<std::pair<std::string, std::string>, double> expected;
    const std::vector<std::string> tickers{"AAPL", "MSFT", "CUR:USD", "TSLA"};
    const std::vector<std::string> providers{"low", "high", "peer_a"};
    for (int i = 0; i < 30; ++i) {
        const auto& ticker = tickers[i % tickers.size()];
        double quantity = (i % 7 == 0 ? -1.0 : 1.0) * (i + 0.25);
        input.push_back(make_position(ticker, quantity, "USD", providers[i % providers.size()]));
        expected[{ticker, "USD"}] += quantity;
    }

    auto result = consolidator.consolidate(input, priorities);

    ASSERT_EQ(result.positions.size(), expected.size());
    for (const auto& position : result.positions) {
        EXPECT_NEAR(position.quantity, (expected[{position.ticker, position.currency}]), 1e-9)
            << position.ticker;
    }
}

TEST_F(PositionConsolidatorTest, ConsolidatingOutputAgainIsNoOp) {
    auto cash = make_position("CUR:USD", 100, "USD", "low");
    cash.security_type_hint = "cash";
    std::vector<Position> input{make_position("AAPL", 100, "USD", "low", "a1", 900.0),
                                make_position("AAPL", 20, "EUR", "high", "a2"),
                                make_position("AAPL", 5, "USD", "high", "a3", 100.0),
                                cash,
                                make_position("MSFT", -3, "USD", "peer_a")};

    auto first = consolidator.consolidate(input, priorities);
    auto second = consolidator.consolidate(to_positions(first.positions, "canonical"), priorities);

    ASSERT_EQ(second.positions.size(), first.positions.size());
    EXPECT_TRUE(second.warnings.empty());
    for (size_t i = 0; i < first.positions.size(); ++i) {
        const auto& a = first.positions[i];
        const auto& b = second.positions[i];
        EXPECT_EQ(a.ticker, b.ticker);
        EXPECT_DOUBLE_EQ(a.quantity, b.quantity);
        EXPECT_EQ(a.currency, b.currency);
        EXPECT_EQ(a.account_id, b.account_id);
        EXPECT_EQ(a.cost_basis, b.cost_basis);
        EXPECT_EQ(a.security_type_hint, b.security_type_hint);
        EXPECT_EQ(a.is_cash, b.is_cash);
    }
}

TEST_F(PositionConsolidatorTest, EmptyInputGivesEmptyOutput) {
    auto result = consolidator.consolidate({}, priorities);
    EXPECT_TRUE(result.positions.empty());
    EXPECT_TRUE(result.warnings.empty());
}
