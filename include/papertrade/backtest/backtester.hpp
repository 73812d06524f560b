// include/papertrade/backtest/backtester.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/portfolio/performance_metrics.hpp"
#include "papertrade/risk/risk_manager.hpp"
#include "papertrade/strategy/types.hpp"

namespace papertrade {

/**
 * @brief Outcome of replaying one strategy over a sample range
 */
struct BacktestResult {
    std::string strategy_id;
    PerformanceSummary summary;
    std::vector<EquityPoint> equity_curve;
    std::vector<Trade> trades;
    size_t samples_processed{0};
    size_t orders{0};
    size_t rejections{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Replays historical samples through the live decision sequence
 *
 * Every run uses its own ledger and its own TradingPipeline, so backtests
 * of different strategies may run concurrently with each other and with
 * live trading. A position still open after the last sample is closed at
 * that sample's close.
 */
class Backtester {
public:
    explicit Backtester(RiskPolicy policy, bool close_on_opposite_signal = false);

    /**
     * @brief Run a strategy over samples ordered by timestamp
     * @return INSUFFICIENT_DATA when there are fewer samples than the
     * strategy's lookback, INVALID_ARGUMENT for invalid parameters
     */
    Result<BacktestResult> run(const Strategy& strategy,
                               const std::vector<PriceSample>& samples) const;

    const RiskPolicy& get_policy() const {
        return risk_.get_policy();
    }

private:
    RiskManager risk_;
    bool close_on_opposite_signal_;
};

}  // namespace papertrade
