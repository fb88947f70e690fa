#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "holdings_ngin/core/error.hpp"

using namespace holdings_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::DATABASE_ERROR, "Store offline", "ClassificationStore");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::DATABASE_ERROR);
    EXPECT_STREQ(error_result.error()->what(), "Store offline");
    EXPECT_EQ(error_result.error()->component(), "ClassificationStore");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<std::string>(ErrorCode::TIMEOUT_ERROR, "too slow");
    EXPECT_THROW(error_result.value(), HoldingsError);

    try {
        error_result.value();
    } catch (const HoldingsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TIMEOUT_ERROR);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    auto taken = result.take_value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, OptionalPayloadDistinguishesMissFromError) {
    Result<std::optional<std::string>> miss(std::optional<std::string>{});
    EXPECT_TRUE(miss.is_ok());
    EXPECT_FALSE(miss.value().has_value());

    Result<std::optional<std::string>> hit(std::optional<std::string>("etf"));
    ASSERT_TRUE(hit.is_ok());
    EXPECT_EQ(*hit.value(), "etf");
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::vector<int>> original(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> moved = std::move(original);

    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().size(), 3u);

    auto error = make_error<std::vector<int>>(ErrorCode::INVALID_DATA, "bad");
    Result<std::vector<int>> moved_error = std::move(error);
    EXPECT_TRUE(moved_error.is_error());
    EXPECT_EQ(moved_error.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto failure = make_error<void>(ErrorCode::INVALID_CONFIGURATION, "missing table");
    EXPECT_TRUE(failure.is_error());
    EXPECT_EQ(failure.error()->code(), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_THROW(failure.value(), HoldingsError);
}

TEST_F(ResultTest, ErrorToString) {
    HoldingsError error(ErrorCode::CONNECTION_ERROR, "Connection refused", "PostgresStore");
    EXPECT_EQ(error.to_string(), "Error in PostgresStore: Connection refused (Code: 16)");
    EXPECT_EQ(error_code_to_string(ErrorCode::CONNECTION_ERROR), "CONNECTION_ERROR");
    EXPECT_EQ(error_code_to_string(ErrorCode::CUSTOM_ERROR_START), "CUSTOM_ERROR");
}
