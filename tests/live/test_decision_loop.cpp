// tests/live/test_decision_loop.cpp
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "core/test_base.hpp"
#include "papertrade/live/decision_loop.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class DecisionLoopTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        RiskPolicy policy;
        policy.stop_loss_pct = 0.05;
        policy.take_profit_pct = 0.10;

        feed_ = std::make_shared<ReplayMarketDataFeed>("BTCUSDT");
        ledger_ = std::make_shared<PortfolioLedger>(100000.0, policy.ledger_limits());
        strategy_slot_ = std::make_shared<ActiveStrategySlot>();
        risk_slot_ = std::make_shared<RiskManagerSlot>(std::make_shared<RiskManager>(policy));
        monitor_ = std::make_shared<PerformanceMonitor>();

        config_.timeframe = Timeframe::SECOND_1;
        config_.tick_interval = 0.005;
        config_.lookback = 50;
    }

    std::unique_ptr<DecisionLoop> make_loop() {
        return std::make_unique<DecisionLoop>(config_, feed_, ledger_, strategy_slot_, risk_slot_,
                                              monitor_);
    }

    void activate(const StrategyParams& params, double score) {
        auto active = std::make_shared<ActiveStrategy>();
        active->strategy = make_strategy(params, Timeframe::SECOND_1).value();
        active->score = score;
        active->activated_at = test_epoch();
        strategy_slot_->store(active);
    }

    void push(const std::vector<double>& closes, Timestamp start = test_epoch()) {
        ASSERT_TRUE(feed_->push_all(make_series(closes, Timeframe::SECOND_1, start)).is_ok());
    }

    std::vector<double> breakout() {
        std::vector<double> closes(10, 90.0);
        closes.push_back(100.0);
        return closes;
    }

    DecisionLoopConfig config_;
    std::shared_ptr<ReplayMarketDataFeed> feed_;
    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<ActiveStrategySlot> strategy_slot_;
    std::shared_ptr<RiskManagerSlot> risk_slot_;
    std::shared_ptr<PerformanceMonitor> monitor_;
};

TEST_F(DecisionLoopTest, RequiresAllCollaborators) {
    EXPECT_THROW(DecisionLoop(config_, nullptr, ledger_, strategy_slot_, risk_slot_),
                 std::invalid_argument);
    EXPECT_THROW(DecisionLoop(config_, feed_, ledger_, nullptr, risk_slot_), std::invalid_argument);
}

TEST_F(DecisionLoopTest, EmptyTicksDoNothing) {
    activate(MomentumParams{10, 0.02}, 0.8);
    auto loop = make_loop();
    const uint64_t mutations = ledger_->mutation_count();

    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(loop->tick().has_value());
    }

    LoopCounters counters = loop->counters();
    EXPECT_EQ(counters.ticks, 3u);
    EXPECT_EQ(counters.empty_ticks, 3u);
    EXPECT_EQ(counters.orders, 0u);
    EXPECT_EQ(counters.evaluations, 0u);
    EXPECT_EQ(ledger_->mutation_count(), mutations);
    EXPECT_TRUE(ledger_->is_flat());
}

TEST_F(DecisionLoopTest, TradesTheActiveStrategy) {
    activate(MomentumParams{10, 0.02}, 0.8);
    auto loop = make_loop();
    push(breakout());

    std::optional<StepOutcome> last;
    for (size_t i = 0; i < breakout().size(); ++i) {
        last = loop->tick();
        ASSERT_TRUE(last.has_value());
    }

    ASSERT_TRUE(last->order.has_value());
    EXPECT_EQ(last->order->direction, Direction::LONG);
    EXPECT_FALSE(ledger_->is_flat());
    EXPECT_EQ(loop->last_signal().direction, Direction::LONG);
    EXPECT_EQ(loop->counters().orders, 1u);
    EXPECT_EQ(loop->counters().evaluations, 11u);
    EXPECT_EQ(monitor_->sample_count(), 11u);
}

TEST_F(DecisionLoopTest, StopLossClosesAndIsCounted) {
    activate(MomentumParams{10, 0.02}, 0.8);
    auto loop = make_loop();
    auto closes = breakout();
    closes.push_back(95.0);
    push(closes);

    for (size_t i = 0; i < closes.size(); ++i) {
        loop->tick();
    }

    auto trades = ledger_->snapshot().trades;
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].exit_reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(trades[0].realized_pnl, -1000.0);
    EXPECT_EQ(loop->counters().exits, 1u);
}

TEST_F(DecisionLoopTest, WithoutStrategyOnlyMarksToMarket) {
    auto loop = make_loop();
    push(breakout());

    for (size_t i = 0; i < breakout().size(); ++i) {
        auto outcome = loop->tick();
        ASSERT_TRUE(outcome.has_value());
        EXPECT_FALSE(outcome->evaluated);
    }
    EXPECT_TRUE(ledger_->is_flat());
    EXPECT_EQ(ledger_->snapshot().equity_curve.size(), breakout().size());
    EXPECT_EQ(loop->counters().evaluations, 0u);
}

TEST_F(DecisionLoopTest, PromotionTakesEffectOnNextTick) {
    activate(RsiParams{14, 30.0, 70.0}, 0.7);
    auto loop = make_loop();
    std::vector<double> closes(12, 90.0);
    push(closes);

    loop->tick();
    EXPECT_EQ(loop->last_signal().strategy_id, strategy_slot_->load()->strategy.id);

    activate(MomentumParams{10, 0.02}, 0.9);
    loop->tick();
    EXPECT_EQ(loop->last_signal().strategy_id,
              make_strategy_id(MomentumParams{10, 0.02}, Timeframe::SECOND_1));
    // The monitor restarted its comparison for the new strategy
    EXPECT_EQ(monitor_->sample_count(), 1u);
}

TEST_F(DecisionLoopTest, RiskProfileSwapAppliesToNextEntry) {
    activate(MomentumParams{10, 0.02}, 0.8);
    auto loop = make_loop();

    RiskPolicy strict;
    strict.min_confidence = 0.99;
    risk_slot_->store(std::make_shared<RiskManager>(strict));

    push(breakout());
    std::optional<StepOutcome> last;
    for (size_t i = 0; i < breakout().size(); ++i) {
        last = loop->tick();
    }
    ASSERT_TRUE(last.has_value());
    ASSERT_TRUE(last->rejection.has_value());
    EXPECT_EQ(*last->rejection, ErrorCode::CONFIDENCE_BELOW_THRESHOLD);
    EXPECT_EQ(loop->counters().rejections, 1u);
    EXPECT_TRUE(ledger_->is_flat());
}

TEST_F(DecisionLoopTest, RegistersWithStateManager) {
    auto loop = make_loop();
    EXPECT_EQ(loop->component_id(), "DECISION_LOOP_BTCUSDT_1s");

    push({100.0, 101.0});
    loop->tick();
    loop->tick();

    auto info = StateManager::instance().get_state(loop->component_id());
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().state, ComponentState::INITIALIZED);
    EXPECT_DOUBLE_EQ(info.value().metrics.at("ticks"), 2.0);

    loop.reset();
    EXPECT_TRUE(StateManager::instance().get_state("DECISION_LOOP_BTCUSDT_1s").is_error());
}

TEST_F(DecisionLoopTest, WorkerThreadDrainsFeed) {
    activate(MomentumParams{10, 0.02}, 0.8);
    auto loop = make_loop();
    push(breakout());

    ASSERT_TRUE(loop->start().is_ok());
    EXPECT_TRUE(loop->is_running());
    auto again = loop->start();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error()->code(), ErrorCode::ALREADY_RUNNING);
    EXPECT_EQ(StateManager::instance().get_state(loop->component_id()).value().state,
              ComponentState::RUNNING);

    for (int i = 0; i < 400 && feed_->pending(Timeframe::SECOND_1) > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    // Let the tick that took the last sample finish
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    loop->stop();

    EXPECT_FALSE(loop->is_running());
    EXPECT_EQ(feed_->pending(Timeframe::SECOND_1), 0u);
    EXPECT_EQ(loop->counters().orders, 1u);
    EXPECT_EQ(StateManager::instance().get_state(loop->component_id()).value().state,
              ComponentState::STOPPED);

    // Stopping twice is harmless
    loop->stop();
}

TEST_F(DecisionLoopTest, TradesCandlesOfTheStrategyTimeframe) {
    auto active = std::make_shared<ActiveStrategy>();
    active->strategy = make_strategy(MomentumParams{10, 0.02}, Timeframe::MINUTE_1).value();
    active->score = 0.8;
    strategy_slot_->store(active);

    // Twenty flat minutes of history, then a live minute at a higher price
    ASSERT_TRUE(feed_->load_history(make_series(std::vector<double>(20, 90.0), Timeframe::MINUTE_1))
                    .is_ok());
    push(std::vector<double>(60, 100.0), test_epoch() + std::chrono::minutes(20));
    auto loop = make_loop();

    for (int i = 0; i < 59; ++i) {
        EXPECT_FALSE(loop->tick().has_value());
    }
    EXPECT_EQ(loop->candle_timeframe(), Timeframe::MINUTE_1);
    EXPECT_TRUE(ledger_->is_flat());

    auto outcome = loop->tick();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->evaluated);
    ASSERT_TRUE(outcome->order.has_value());
    EXPECT_EQ(outcome->order->direction, Direction::LONG);

    LoopCounters counters = loop->counters();
    EXPECT_EQ(counters.ticks, 60u);
    EXPECT_EQ(counters.pending_ticks, 59u);
    EXPECT_EQ(counters.evaluations, 1u);
    EXPECT_EQ(monitor_->sample_count(), 1u);
    EXPECT_EQ(ledger_->snapshot().equity_curve.back().first,
              test_epoch() + std::chrono::minutes(20));
}

TEST_F(DecisionLoopTest, SnapshotResumesOpenCandle) {
    auto active = std::make_shared<ActiveStrategy>();
    active->strategy = make_strategy(MomentumParams{10, 0.02}, Timeframe::MINUTE_1).value();
    strategy_slot_->store(active);
    push(std::vector<double>(90, 100.0));

    LoopSnapshot saved;
    {
        auto loop = make_loop();
        for (int i = 0; i < 75; ++i) {
            loop->tick();
        }
        saved = loop->snapshot();
    }
    EXPECT_EQ(saved.timeframe, Timeframe::MINUTE_1);
    ASSERT_EQ(saved.window.size(), 1u);
    ASSERT_TRUE(saved.partial.has_value());
    EXPECT_EQ(saved.partial->timestamp, test_epoch() + std::chrono::minutes(1));

    auto parsed = LoopSnapshot::from_json(saved.to_json());
    EXPECT_EQ(parsed.timeframe, Timeframe::MINUTE_1);
    ASSERT_TRUE(parsed.partial.has_value());
    EXPECT_DOUBLE_EQ(parsed.partial->volume, saved.partial->volume);

    auto resumed = make_loop();
    ASSERT_TRUE(resumed->restore(parsed).is_ok());
    EXPECT_EQ(resumed->candle_timeframe(), Timeframe::MINUTE_1);
    EXPECT_EQ(resumed->snapshot().window.size(), 1u);

    auto j = saved.to_json();
    j["timeframe"] = "2m";
    EXPECT_THROW(LoopSnapshot::from_json(j), std::invalid_argument);

    resumed.reset();
    config_.timeframe = Timeframe::MINUTE_5;
    auto coarse = make_loop();
    auto refused = coarse->restore(parsed);
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DecisionLoopTest, ConfigParsing) {
    DecisionLoopConfig config;
    config.from_json({{"timeframe", "5m"}, {"tick_interval", 0.5}, {"lookback", 300}});
    EXPECT_EQ(config.timeframe, Timeframe::MINUTE_5);
    EXPECT_DOUBLE_EQ(config.tick_interval, 0.5);
    EXPECT_EQ(config.lookback, 300u);
    EXPECT_TRUE(config.validate().is_ok());

    EXPECT_THROW(config.from_json({{"timeframe", "2m"}}), std::invalid_argument);

    config.tick_interval = 0.0;
    EXPECT_TRUE(config.validate().is_error());
}
