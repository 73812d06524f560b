// tests/core/test_result.cpp
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "papertrade/core/error.hpp"

using namespace papertrade;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result = make_error<int>(ErrorCode::CONFIDENCE_BELOW_THRESHOLD,
                                        "confidence 0.1 below 0.2", "RiskManager");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::CONFIDENCE_BELOW_THRESHOLD);
    EXPECT_STREQ(error_result.error()->what(), "confidence 0.1 below 0.2");
    EXPECT_EQ(error_result.error()->component(), "RiskManager");
}

TEST_F(ResultTest, ValueOnErrorThrowsTradeError) {
    auto error_result = make_error<int>(ErrorCode::INSUFFICIENT_DATA, "empty window");
    EXPECT_THROW(error_result.value(), TradeError);
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    Result<std::unique_ptr<int>> moved = std::move(result);
    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(*moved.value(), 42);
}

TEST_F(ResultTest, TakeValueMovesOut) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> values = result.take_value();
    EXPECT_EQ(values.size(), 3u);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::NO_OPEN_POSITION, "Nothing to close", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_THROW(error.value(), TradeError);
}

TEST_F(ResultTest, ForwardErrorKeepsDetails) {
    auto source = make_error<double>(ErrorCode::FILE_NOT_FOUND, "missing.csv", "CsvPriceLoader");
    auto forwarded = forward_error<std::string>(source);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::FILE_NOT_FOUND);
    EXPECT_STREQ(forwarded.error()->what(), "missing.csv");
    EXPECT_EQ(forwarded.error()->component(), "CsvPriceLoader");
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::POSITION_ALREADY_OPEN), "POSITION_ALREADY_OPEN");
    EXPECT_EQ(error_code_to_string(ErrorCode::INVALID_STOP_PLACEMENT), "INVALID_STOP_PLACEMENT");
    EXPECT_EQ(error_code_to_string(ErrorCode::CYCLE_IN_PROGRESS), "CYCLE_IN_PROGRESS");
}
