// include/papertrade/strategy/signal_evaluator.hpp
#pragma once

#include <optional>
#include <vector>
#include "papertrade/core/types.hpp"
#include "papertrade/strategy/types.hpp"

namespace papertrade {

namespace indicators {

/**
 * @brief Simple mean of the last n values
 * @return nullopt if fewer than n values are available
 */
std::optional<double> sma(const std::vector<double>& values, size_t n, size_t end);

/**
 * @brief Exponential moving average series seeded with the SMA of the
 * first period values. Entries before the seed are NaN.
 */
std::vector<double> ema_series(const std::vector<double>& values, int period);

/**
 * @brief Population standard deviation of the last n values ending at end
 */
std::optional<double> stddev(const std::vector<double>& values, size_t n, size_t end);

/**
 * @brief RSI from simple average gains and losses over period changes
 * @return Value in [0, 100], 50 for a completely flat window
 */
std::optional<double> rsi(const std::vector<double>& closes, int period);

/**
 * @brief Average true range over the last period samples
 */
std::optional<double> atr(const std::vector<PriceSample>& window, int period);

std::vector<double> closes(const std::vector<PriceSample>& window);

}  // namespace indicators

/**
 * @brief Pure, deterministic evaluation of a strategy over a price window
 *
 * Only the newest lookback(params) samples of the window are read, so the
 * same tail always yields the same signal regardless of how much older
 * history the caller keeps. A window shorter than the lookback yields
 * Signal::none.
 */
class SignalEvaluator {
public:
    static Signal evaluate(const std::vector<PriceSample>& window, const Strategy& strategy);

    /**
     * @brief Number of samples a family needs before it can signal
     */
    static size_t lookback(const StrategyParams& params);
    static size_t lookback(const Strategy& strategy) {
        return lookback(strategy.params);
    }

private:
    static Signal evaluate(const std::vector<double>& closes, const MeanReversionParams& p);
    static Signal evaluate(const std::vector<double>& closes, const MaCrossoverParams& p);
    static Signal evaluate(const std::vector<double>& closes, const RsiParams& p);
    static Signal evaluate(const std::vector<double>& closes, const MacdParams& p);
    static Signal evaluate(const std::vector<double>& closes, const MomentumParams& p);
};

}  // namespace papertrade
