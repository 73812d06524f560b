// include/papertrade/execution/trading_pipeline.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"
#include "papertrade/risk/risk_manager.hpp"
#include "papertrade/strategy/types.hpp"

namespace papertrade {

struct PipelineOptions {
    size_t window_capacity{500};          // samples kept for evaluation
    bool close_on_opposite_signal{false}; // opposite signal closes the open position
    bool log_rejections{true};            // INFO for live use, DEBUG otherwise
};

/**
 * @brief What one step did to the ledger
 */
struct StepOutcome {
    std::optional<Trade> exit;
    Signal signal;
    bool evaluated{false};
    std::optional<Order> order;
    std::optional<ErrorCode> rejection;
    std::string rejection_reason;
    double equity{0.0};
};

/**
 * @brief Per-sample decision sequence shared by live trading and backtests
 *
 * For each sample, in order: record it in the rolling window, close the
 * open position if its stop or target was reached, evaluate the strategy
 * when flat, size the signal through the risk manager, apply the order,
 * then mark the ledger to market. Exits are always processed before
 * entries within a step. The window grows on its own to what the strategy
 * and the risk policy of a step need, so every caller decides on the same
 * data.
 */
class TradingPipeline {
public:
    explicit TradingPipeline(PipelineOptions options = {});

    /**
     * @param sample Newest observation
     * @param strategy Strategy to evaluate, nullptr to only manage exits
     * @param risk Sizing rules in force for this step
     * @param ledger Ledger the resulting order applies to
     */
    StepOutcome step(const PriceSample& sample, const Strategy* strategy, const RiskManager& risk,
                     PortfolioLedger& ledger);

    /**
     * @brief Grow the window so a strategy with this lookback can signal
     */
    void ensure_capacity(size_t samples);

    /**
     * @brief Window length a step needs: the strategy's lookback, or the
     * ATR period plus one when stops are ATR based and that is longer
     */
    static size_t required_capacity(const Strategy& strategy, const RiskPolicy& policy);

    /**
     * @brief Replace the window with the newest samples of a history
     */
    void prime(const std::vector<PriceSample>& samples);

    const std::vector<PriceSample>& window() const {
        return window_;
    }

    size_t capacity() const {
        return options_.window_capacity;
    }

    void clear() {
        window_.clear();
    }

private:
    void record(const PriceSample& sample);
    void route(const Signal& signal, const RiskManager& risk, PortfolioLedger& ledger,
               StepOutcome& outcome);

    PipelineOptions options_;
    std::vector<PriceSample> window_;
};

}  // namespace papertrade
