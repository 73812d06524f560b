// tests/risk/test_risk_manager.cpp
#include <gtest/gtest.h>
#include <stdexcept>
#include "core/test_base.hpp"
#include "papertrade/risk/risk_manager.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class RiskManagerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        policy_.stop_loss_pct = 0.05;
        policy_.take_profit_pct = 0.10;
        window_ = make_series(std::vector<double>(30, 100.0), Timeframe::MINUTE_5);
    }

    Signal signal(Direction direction, double confidence,
                  SignalIntent intent = SignalIntent::ENTRY) {
        Signal s;
        s.direction = direction;
        s.confidence = confidence;
        s.intent = intent;
        s.strategy_id = "RSI_14_30_70_5m";
        s.timestamp = window_.back().timestamp;
        return s;
    }

    Portfolio flat_portfolio(double balance = 100000.0) {
        Portfolio p;
        p.starting_balance = balance;
        p.cash = balance;
        return p;
    }

    RiskPolicy policy_;
    std::vector<PriceSample> window_;
};

TEST_F(RiskManagerTest, FullConfidenceIsCappedAtMaxFraction) {
    RiskManager risk(policy_);
    auto result = risk.evaluate(signal(Direction::LONG, 1.0), flat_portfolio(), window_);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const Order& order = result.value();
    EXPECT_EQ(order.action, OrderAction::OPEN);
    EXPECT_EQ(order.direction, Direction::LONG);
    EXPECT_DOUBLE_EQ(order.size_fraction, 0.20);
    EXPECT_DOUBLE_EQ(order.notional, 20000.0);
    EXPECT_DOUBLE_EQ(order.quantity, 200.0);
    EXPECT_DOUBLE_EQ(order.entry_price, 100.0);
    EXPECT_DOUBLE_EQ(order.stop_loss, 95.0);
    EXPECT_DOUBLE_EQ(order.take_profit, 110.0);
    EXPECT_EQ(order.strategy_id, "RSI_14_30_70_5m");
}

TEST_F(RiskManagerTest, SizeScalesWithConfidence) {
    RiskManager risk(policy_);
    auto result = risk.evaluate(signal(Direction::SHORT, 0.1 + 0.05), flat_portfolio(), window_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIDENCE_BELOW_THRESHOLD);

    auto sized = risk.evaluate(signal(Direction::SHORT, 0.5), flat_portfolio(), window_);
    ASSERT_TRUE(sized.is_ok());
    // min(max_fraction, confidence * scale)
    EXPECT_DOUBLE_EQ(sized.value().size_fraction, 0.20);

    policy_.confidence_scale = 0.25;
    RiskManager scaled(policy_);
    auto small = scaled.evaluate(signal(Direction::SHORT, 0.5), flat_portfolio(), window_);
    ASSERT_TRUE(small.is_ok());
    EXPECT_DOUBLE_EQ(small.value().size_fraction, 0.125);
    EXPECT_DOUBLE_EQ(small.value().stop_loss, 105.0);
    EXPECT_DOUBLE_EQ(small.value().take_profit, 90.0);
}

TEST_F(RiskManagerTest, FlatSignalIsInvalid) {
    RiskManager risk(policy_);
    auto result = risk.evaluate(signal(Direction::FLAT, 0.0), flat_portfolio(), window_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_SIGNAL);
}

TEST_F(RiskManagerTest, SecondPositionIsRejected) {
    RiskManager risk(policy_);
    Portfolio portfolio = flat_portfolio();
    Position position;
    position.order = risk.evaluate(signal(Direction::LONG, 0.9), portfolio, window_).value();
    portfolio.open_position = position;

    auto result = risk.evaluate(signal(Direction::SHORT, 0.9), portfolio, window_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POSITION_ALREADY_OPEN);
}

TEST_F(RiskManagerTest, CloseIntentNeedsOpenPosition) {
    RiskManager risk(policy_);
    auto rejected = risk.evaluate(signal(Direction::SHORT, 0.9, SignalIntent::CLOSE),
                                  flat_portfolio(), window_);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::INVALID_SIGNAL);

    Portfolio portfolio = flat_portfolio();
    Position position;
    position.order = risk.evaluate(signal(Direction::LONG, 0.9), portfolio, window_).value();
    portfolio.open_position = position;

    auto close = risk.evaluate(signal(Direction::SHORT, 0.9, SignalIntent::CLOSE), portfolio,
                               window_);
    ASSERT_TRUE(close.is_ok());
    EXPECT_EQ(close.value().action, OrderAction::CLOSE);
    EXPECT_EQ(close.value().direction, Direction::LONG);
    EXPECT_DOUBLE_EQ(close.value().entry_price, 100.0);
}

TEST_F(RiskManagerTest, TinyAccountFallsBelowMinimumNotional) {
    RiskManager risk(policy_);
    auto result = risk.evaluate(signal(Direction::LONG, 0.9), flat_portfolio(300.0), window_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POSITION_LIMIT_EXCEEDED);
}

TEST_F(RiskManagerTest, DailyTradeLimit) {
    policy_.max_daily_trades = 2;
    RiskManager risk(policy_);
    Portfolio portfolio = flat_portfolio();
    for (int i = 0; i < 2; ++i) {
        Trade trade;
        trade.entry_time = window_.front().timestamp;
        trade.exit_time = window_.front().timestamp;
        portfolio.trades.push_back(trade);
    }

    auto result = risk.evaluate(signal(Direction::LONG, 0.9), portfolio, window_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POSITION_LIMIT_EXCEEDED);

    policy_.max_daily_trades = 0;
    RiskManager unlimited(policy_);
    EXPECT_TRUE(unlimited.evaluate(signal(Direction::LONG, 0.9), portfolio, window_).is_ok());
}

TEST_F(RiskManagerTest, StopsOnWrongSideAreRejected) {
    policy_.take_profit_pct = 1.5;
    RiskManager risk(policy_);
    // A short target below zero
    auto result = risk.calculate_stops(Direction::SHORT, 100.0, window_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_STOP_PLACEMENT);

    auto order = risk.evaluate(signal(Direction::SHORT, 0.9), flat_portfolio(), window_);
    ASSERT_TRUE(order.is_error());
    EXPECT_EQ(order.error()->code(), ErrorCode::INVALID_STOP_PLACEMENT);

    EXPECT_TRUE(risk.calculate_stops(Direction::LONG, 100.0, window_).is_ok());
}

TEST_F(RiskManagerTest, AtrStops) {
    policy_.stop_mode = StopMode::ATR;
    policy_.atr_period = 14;
    policy_.atr_stop_multiple = 2.0;
    policy_.atr_target_multiple = 4.0;
    RiskManager risk(policy_);

    std::vector<PriceSample> bars;
    for (int i = 0; i < 20; ++i) {
        bars.emplace_back(test_epoch() + std::chrono::minutes(5 * i), 100.0, 101.0, 99.0, 100.0,
                          1.0, Timeframe::MINUTE_5);
    }
    auto stops = risk.calculate_stops(Direction::LONG, 100.0, bars);
    ASSERT_TRUE(stops.is_ok());
    EXPECT_DOUBLE_EQ(stops.value().first, 96.0);
    EXPECT_DOUBLE_EQ(stops.value().second, 108.0);

    std::vector<PriceSample> short_window(bars.begin(), bars.begin() + 5);
    auto missing = risk.calculate_stops(Direction::LONG, 100.0, short_window);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(RiskManagerTest, ProfilesAreValidPresets) {
    for (auto profile : {RiskProfile::DEFAULT, RiskProfile::CONSERVATIVE, RiskProfile::AGGRESSIVE,
                         RiskProfile::LEARNING}) {
        RiskPolicy preset = risk_policy_for(profile);
        EXPECT_TRUE(validate_policy(preset).is_ok()) << risk_profile_to_string(profile);
        EXPECT_EQ(risk_profile_from_string(risk_profile_to_string(profile)), profile);
    }
    EXPECT_LT(risk_policy_for(RiskProfile::CONSERVATIVE).max_position_fraction,
              risk_policy_for(RiskProfile::AGGRESSIVE).max_position_fraction);
    EXPECT_FALSE(risk_profile_from_string("YOLO").has_value());
}

TEST_F(RiskManagerTest, PolicyValidation) {
    RiskPolicy bad = policy_;
    bad.max_position_fraction = 1.5;
    auto result = validate_policy(bad);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    bad = policy_;
    bad.stop_loss_pct = 0.0;
    EXPECT_TRUE(validate_policy(bad).is_error());

    bad = policy_;
    bad.max_concurrent_positions = 2;
    EXPECT_TRUE(validate_policy(bad).is_error());

    bad = policy_;
    bad.min_confidence = -0.1;
    EXPECT_TRUE(validate_policy(bad).is_error());
}

TEST_F(RiskManagerTest, PolicyJsonKeepsUnsetFields) {
    RiskPolicy policy;
    policy.from_json({{"stop_mode", "ATR"}, {"fee_rate", 0.001}});
    EXPECT_EQ(policy.stop_mode, StopMode::ATR);
    EXPECT_DOUBLE_EQ(policy.fee_rate, 0.001);
    EXPECT_DOUBLE_EQ(policy.max_position_fraction, 0.20);

    RiskPolicy copy;
    copy.from_json(policy.to_json());
    EXPECT_EQ(copy.to_json(), policy.to_json());
}

TEST_F(RiskManagerTest, UnknownStopModeThrows) {
    RiskPolicy policy;
    EXPECT_THROW(policy.from_json({{"stop_mode", "TRAILING"}}), std::invalid_argument);
    EXPECT_EQ(policy.stop_mode, StopMode::PERCENT);

    policy.from_json({{"stop_mode", "ATR"}});
    policy.from_json({{"stop_mode", "PERCENT"}});
    EXPECT_EQ(policy.stop_mode, StopMode::PERCENT);
}
