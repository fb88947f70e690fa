#include <gtest/gtest.h>
#include <cstdlib>
#include "../core/test_base.hpp"
#include "holdings_ngin/classification/fmp_classifier.hpp"

using namespace holdings_ngin;
using namespace holdings_ngin::testing;

class FmpClassifierTest : public TestBase {};

TEST_F(FmpClassifierTest, EtfProfile) {
    auto result = FmpClassifier::parse_profile(
        "ZZZ", R"([{"symbol": "ZZZ", "companyName": "Some Index ETF", "isEtf": true,
                    "isFund": false, "exchange": "NASDAQ", "industry": "Asset Management"}])");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().is_etf);
    EXPECT_EQ(result.value().to_security_type(), SecurityType::ETF);
    EXPECT_EQ(result.value().description, "Some Index ETF");
}

TEST_F(FmpClassifierTest, FundProfile) {
    auto result = FmpClassifier::parse_profile(
        "DSU", R"([{"symbol": "DSU", "companyName": "BlackRock Debt Strategies Fund",
                    "isEtf": false, "isFund": true, "industry": "Asset Management - Bonds"}])");

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().is_bond);
    EXPECT_EQ(result.value().to_security_type(), SecurityType::MUTUAL_FUND);
}

TEST_F(FmpClassifierTest, MoneyMarketIsCash) {
    auto result = FmpClassifier::parse_profile(
        "SWVXX", R"([{"symbol": "SWVXX", "companyName": "Schwab Value Advantage Money Market Fund",
                      "isEtf": false, "isFund": true}])");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().is_cash_marker);
    EXPECT_EQ(result.value().to_security_type(), SecurityType::CASH);
}

TEST_F(FmpClassifierTest, PlainCompanyIsEquity) {
    auto result = FmpClassifier::parse_profile(
        "AAPL", R"([{"symbol": "AAPL", "companyName": "Apple Inc.", "isEtf": false,
                     "isFund": false, "exchange": "NASDAQ", "industry": "Consumer Electronics"}])");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().to_security_type(), SecurityType::EQUITY);
}

TEST_F(FmpClassifierTest, CryptoExchange) {
    auto result = FmpClassifier::parse_profile(
        "BTCUSD", R"([{"symbol": "BTCUSD", "companyName": "Bitcoin USD", "exchange": "CRYPTO"}])");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().to_security_type(), SecurityType::CRYPTO);
}

TEST_F(FmpClassifierTest, EmptyResponseIsNotFound) {
    auto result = FmpClassifier::parse_profile("NOPE", "[]");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(FmpClassifierTest, InvalidJsonIsParseError) {
    auto result = FmpClassifier::parse_profile("AAPL", "<html>rate limited</html>");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(FmpClassifierTest, MissingApiKeyIsConfigurationError) {
    unsetenv("FMP_API_KEY");
    FmpClassifier classifier{FmpConfig()};

    auto result = classifier.lookup("AAPL");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(FmpClassifierTest, UnreachableHostIsConnectionError) {
    FmpConfig config;
    config.base_url = "http://127.0.0.1:1";
    config.api_key = "test-key";
    config.request_timeout = std::chrono::milliseconds(2000);
    FmpClassifier classifier(config);

    auto result = classifier.lookup("AAPL");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONNECTION_ERROR);
}

TEST_F(FmpClassifierTest, ConfigNeverSerializesApiKey) {
    FmpConfig config;
    config.from_json({{"api_key", "secret"}, {"request_timeout_ms", 2500}});
    EXPECT_EQ(config.resolved_api_key(), "secret");
    EXPECT_EQ(config.request_timeout.count(), 2500);
    EXPECT_FALSE(config.to_json().contains("api_key"));
}
