// include/papertrade/live/decision_loop.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "papertrade/core/config_base.hpp"
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/data/candle_aggregator.hpp"
#include "papertrade/data/market_data_feed.hpp"
#include "papertrade/execution/trading_pipeline.hpp"
#include "papertrade/live/active_strategy_slot.hpp"
#include "papertrade/monitor/performance_monitor.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"
#include "papertrade/risk/risk_manager.hpp"

namespace papertrade {

using RiskManagerSlot = SwappableSlot<RiskManager>;

struct DecisionLoopConfig : public ConfigBase {
    Timeframe timeframe{Timeframe::SECOND_1};  // live sample timeframe, candles are built from it
    double tick_interval{1.0};                 // seconds between ticks on the worker thread
    size_t lookback{500};                      // recent samples kept for evaluation
    bool close_on_opposite_signal{false};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Running totals since construction
 */
struct LoopCounters {
    uint64_t ticks{0};
    uint64_t empty_ticks{0};    // no new sample from the feed
    uint64_t pending_ticks{0};  // sample folded into a candle that is still open
    uint64_t evaluations{0};
    uint64_t orders{0};
    uint64_t rejections{0};
    uint64_t exits{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Candle state needed to resume trading where the loop stopped
 */
struct LoopSnapshot {
    Timeframe timeframe{Timeframe::SECOND_1};  // candle timeframe being traded
    std::vector<PriceSample> window;
    std::optional<PriceSample> partial;

    nlohmann::json to_json() const;

    /**
     * @throws std::invalid_argument for an unknown timeframe
     */
    static LoopSnapshot from_json(const nlohmann::json& j);
};

/**
 * @brief Live paper-trading loop over one instrument
 *
 * Each tick pulls at most one sample from the feed and folds it into a
 * candle of the active strategy's timeframe. Every candle that completes
 * goes through the TradingPipeline against the shared ledger, so the live
 * strategy sees the same candles its backtest did. When the active
 * strategy moves to another timeframe the window is rebuilt from that
 * timeframe's history. The active strategy and the risk manager are each
 * read once per tick from their slots, so a promotion or profile change
 * takes effect on the next tick without blocking the current one. tick()
 * may be called directly to drive the loop faster than real time; start()
 * runs it on a worker thread every tick_interval seconds.
 */
class DecisionLoop {
public:
    DecisionLoop(DecisionLoopConfig config, std::shared_ptr<MarketDataFeed> feed,
                 std::shared_ptr<PortfolioLedger> ledger,
                 std::shared_ptr<ActiveStrategySlot> strategy_slot,
                 std::shared_ptr<RiskManagerSlot> risk_slot,
                 std::shared_ptr<PerformanceMonitor> monitor = nullptr);

    ~DecisionLoop();

    DecisionLoop(const DecisionLoop&) = delete;
    DecisionLoop& operator=(const DecisionLoop&) = delete;

    /**
     * @brief Process one tick
     * @return What the pipeline did on the last candle completed by this
     * tick, nullopt if the feed had no new sample or no candle completed
     */
    std::optional<StepOutcome> tick();

    LoopSnapshot snapshot() const;

    /**
     * @brief Resume from a snapshot taken by an earlier loop
     * @return INVALID_ARGUMENT when its candles cannot be built from the
     * live timeframe
     */
    Result<void> restore(const LoopSnapshot& snapshot);

    /**
     * @brief Timeframe of the candles currently traded
     */
    Timeframe candle_timeframe() const;

    /**
     * @brief Run tick() on a worker thread
     * @return ALREADY_RUNNING if the worker is active
     */
    Result<void> start();

    /**
     * @brief Stop the worker and wait for the current tick to finish
     */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    Signal last_signal() const;
    LoopCounters counters() const;

    const std::string& component_id() const {
        return component_id_;
    }

    const DecisionLoopConfig& get_config() const {
        return config_;
    }

private:
    void run();
    void track_activation(const std::shared_ptr<const ActiveStrategy>& active,
                          const Timestamp& now);
    void switch_timeframe(Timeframe target, const Timestamp& now);
    void handle_outcome(const PriceSample& candle, const StepOutcome& outcome);
    void publish_metrics();

    DecisionLoopConfig config_;
    std::shared_ptr<MarketDataFeed> feed_;
    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<ActiveStrategySlot> strategy_slot_;
    std::shared_ptr<RiskManagerSlot> risk_slot_;
    std::shared_ptr<PerformanceMonitor> monitor_;

    TradingPipeline pipeline_;
    CandleAggregator aggregator_;
    std::shared_ptr<const ActiveStrategy> last_active_;
    std::string component_id_;

    mutable std::mutex tick_mutex_;  // guards pipeline_, aggregator_, counters_, last_signal_
    LoopCounters counters_;
    Signal last_signal_;
    bool drift_alerted_{false};  // warn once per excursion past the alert threshold

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace papertrade
