// tests/execution/test_trading_pipeline.cpp
#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "papertrade/execution/trading_pipeline.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class TradingPipelineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        policy_.stop_loss_pct = 0.05;
        policy_.take_profit_pct = 0.10;
        strategy_ = make_strategy(MomentumParams{10, 0.02}, Timeframe::MINUTE_5).value();
    }

    // Ten flat closes then a jump: the momentum strategy goes long at the jump
    std::vector<double> breakout() {
        std::vector<double> closes(10, 90.0);
        closes.push_back(100.0);
        return closes;
    }

    std::vector<StepOutcome> run(TradingPipeline& pipeline, const std::vector<double>& closes,
                                 const RiskManager& risk, PortfolioLedger& ledger) {
        std::vector<StepOutcome> outcomes;
        for (const auto& sample : make_series(closes, Timeframe::MINUTE_5)) {
            outcomes.push_back(pipeline.step(sample, &strategy_, risk, ledger));
        }
        return outcomes;
    }

    RiskPolicy policy_;
    Strategy strategy_;
};

TEST_F(TradingPipelineTest, StopLossRoundTrip) {
    RiskManager risk(policy_);
    PortfolioLedger ledger(100000.0, policy_.ledger_limits());
    TradingPipeline pipeline(PipelineOptions{50, false, false});

    auto closes = breakout();
    auto outcomes = run(pipeline, closes, risk, ledger);

    const StepOutcome& entry = outcomes.back();
    ASSERT_TRUE(entry.order.has_value());
    EXPECT_EQ(entry.order->direction, Direction::LONG);
    EXPECT_DOUBLE_EQ(entry.order->size_fraction, 0.20);
    EXPECT_DOUBLE_EQ(entry.order->quantity, 200.0);
    EXPECT_DOUBLE_EQ(entry.order->stop_loss, 95.0);

    // Price falls to the stop on the next sample
    closes.push_back(95.0);
    auto samples = make_series(closes, Timeframe::MINUTE_5);
    StepOutcome exit = pipeline.step(samples.back(), &strategy_, risk, ledger);

    ASSERT_TRUE(exit.exit.has_value());
    EXPECT_EQ(exit.exit->exit_reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(exit.exit->realized_pnl, -1000.0);
    EXPECT_DOUBLE_EQ(ledger.snapshot().trades.front().realized_pnl, -1000.0);
    EXPECT_DOUBLE_EQ(exit.equity, 99000.0);
}

TEST_F(TradingPipelineTest, ExitIsProcessedBeforeEntry) {
    RiskManager risk(policy_);
    PortfolioLedger ledger(100000.0, policy_.ledger_limits());
    TradingPipeline pipeline(PipelineOptions{50, false, false});

    auto closes = breakout();
    closes.push_back(95.0);
    auto outcomes = run(pipeline, closes, risk, ledger);

    // The stop frees the slot and the still-bullish signal re-enters in the same step
    const StepOutcome& last = outcomes.back();
    ASSERT_TRUE(last.exit.has_value());
    ASSERT_TRUE(last.order.has_value());
    EXPECT_DOUBLE_EQ(last.order->entry_price, 95.0);
    EXPECT_EQ(ledger.trade_count(), 1u);
    EXPECT_FALSE(ledger.is_flat());
}

TEST_F(TradingPipelineTest, NoEvaluationWhileInPosition) {
    RiskManager risk(policy_);
    PortfolioLedger ledger(100000.0, policy_.ledger_limits());
    TradingPipeline pipeline(PipelineOptions{50, false, false});

    auto closes = breakout();
    closes.push_back(101.0);
    closes.push_back(102.0);
    auto outcomes = run(pipeline, closes, risk, ledger);

    EXPECT_TRUE(outcomes[10].evaluated);
    EXPECT_FALSE(outcomes[11].evaluated);
    EXPECT_FALSE(outcomes[12].evaluated);
    EXPECT_FALSE(outcomes[12].order.has_value());
    EXPECT_EQ(ledger.snapshot().equity_curve.size(), closes.size());
}

TEST_F(TradingPipelineTest, OppositeSignalClosesWhenEnabled) {
    policy_.stop_loss_pct = 0.5;
    policy_.take_profit_pct = 1.0;
    RiskManager risk(policy_);

    auto closes = breakout();
    closes.push_back(80.0);

    PortfolioLedger closing_ledger(100000.0, policy_.ledger_limits());
    TradingPipeline closing(PipelineOptions{50, true, false});
    auto outcomes = run(closing, closes, risk, closing_ledger);

    const StepOutcome& last = outcomes.back();
    EXPECT_TRUE(last.evaluated);
    EXPECT_EQ(last.signal.direction, Direction::SHORT);
    ASSERT_TRUE(last.order.has_value());
    EXPECT_EQ(last.order->action, OrderAction::CLOSE);
    EXPECT_TRUE(closing_ledger.is_flat());
    auto trades = closing_ledger.snapshot().trades;
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].exit_reason, ExitReason::SIGNAL_CLOSE);
    EXPECT_DOUBLE_EQ(trades[0].realized_pnl, -4000.0);

    PortfolioLedger holding_ledger(100000.0, policy_.ledger_limits());
    TradingPipeline holding(PipelineOptions{50, false, false});
    run(holding, closes, risk, holding_ledger);
    EXPECT_FALSE(holding_ledger.is_flat());
}

TEST_F(TradingPipelineTest, RejectionIsReportedWithoutMutation) {
    policy_.min_confidence = 0.99;
    RiskManager risk(policy_);
    PortfolioLedger ledger(100000.0, policy_.ledger_limits());
    TradingPipeline pipeline(PipelineOptions{50, false, false});

    auto outcomes = run(pipeline, breakout(), risk, ledger);
    const StepOutcome& last = outcomes.back();
    EXPECT_FALSE(last.signal.is_flat());
    ASSERT_TRUE(last.rejection.has_value());
    EXPECT_EQ(*last.rejection, ErrorCode::CONFIDENCE_BELOW_THRESHOLD);
    EXPECT_FALSE(last.rejection_reason.empty());
    EXPECT_TRUE(ledger.is_flat());
}

TEST_F(TradingPipelineTest, NullStrategyOnlyManagesExits) {
    RiskManager risk(policy_);
    PortfolioLedger ledger(100000.0, policy_.ledger_limits());
    TradingPipeline pipeline(PipelineOptions{50, false, false});

    for (const auto& sample : make_series(breakout(), Timeframe::MINUTE_5)) {
        StepOutcome outcome = pipeline.step(sample, nullptr, risk, ledger);
        EXPECT_FALSE(outcome.evaluated);
        EXPECT_FALSE(outcome.order.has_value());
    }
    EXPECT_TRUE(ledger.is_flat());
    EXPECT_EQ(pipeline.window().size(), 11u);
}

TEST_F(TradingPipelineTest, WindowIsBounded) {
    RiskManager risk(policy_);
    PortfolioLedger ledger(100000.0, policy_.ledger_limits());
    TradingPipeline pipeline(PipelineOptions{20, false, false});

    for (const auto& sample : make_series(std::vector<double>(100, 100.0), Timeframe::MINUTE_5)) {
        pipeline.step(sample, nullptr, risk, ledger);
        EXPECT_LT(pipeline.window().size(), 40u);
    }
    EXPECT_GE(pipeline.window().size(), 20u);

    pipeline.ensure_capacity(64);
    EXPECT_EQ(pipeline.capacity(), 64u);
    pipeline.ensure_capacity(10);
    EXPECT_EQ(pipeline.capacity(), 64u);
}
