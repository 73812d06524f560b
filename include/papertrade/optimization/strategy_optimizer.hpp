// include/papertrade/optimization/strategy_optimizer.hpp
#pragma once

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "papertrade/backtest/backtester.hpp"
#include "papertrade/core/config_base.hpp"
#include "papertrade/core/error.hpp"
#include "papertrade/risk/risk_manager.hpp"
#include "papertrade/strategy/types.hpp"

namespace papertrade {

/**
 * @brief Weights and targets of the composite strategy score
 *
 * Each component is normalized to [0, 1] before weighting and the
 * weighted sum is divided by the sum of weights, so the score stays in
 * [0, 1] for any non-negative weights.
 */
struct ScoringWeights : public ConfigBase {
    double return_weight{0.35};
    double win_rate_weight{0.25};
    double sharpe_weight{0.25};
    double drawdown_weight{0.15};

    double return_target{0.10};           // total return scoring 1.0
    double sharpe_target{3.0};            // Sharpe ratio scoring 1.0
    double max_drawdown_tolerance{0.20};  // drawdown scoring 0.0
    int min_trades{5};                    // below this, win rate and Sharpe score 0

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

struct OptimizerConfig : public ConfigBase {
    size_t max_parallel_evaluations{4};
    size_t top_n{15};  // winners kept per cycle
    bool close_on_opposite_signal{false};
    ScoringWeights scoring;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief A strategy with the backtest it was scored on
 */
struct ScoredStrategy {
    Strategy strategy;
    BacktestResult backtest;
    double score{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of evaluating one population
 */
struct OptimizationResult {
    std::vector<ScoredStrategy> ranked;  // every successful candidate, best first
    size_t evaluated{0};
    size_t failed{0};
    std::vector<std::string> failed_ids;
    size_t top_n{0};

    /**
     * @brief The top_n best candidates
     */
    std::vector<ScoredStrategy> winners() const;

    const ScoredStrategy* find(const std::string& strategy_id) const;
};

/**
 * @brief Backtests a population of strategies in parallel and ranks them
 */
class StrategyOptimizer {
public:
    StrategyOptimizer(OptimizerConfig config, RiskPolicy policy);

    /**
     * @brief Evaluate every candidate over the same samples
     *
     * Candidates whose backtest fails are excluded from the ranking and
     * reported in failed_ids. Evaluation order does not affect the result.
     */
    OptimizationResult run_cycle(const std::vector<Strategy>& population,
                                 const std::vector<PriceSample>& samples) const;

    /**
     * @brief Evaluate every candidate over the history of its own timeframe
     *
     * A candidate whose timeframe has no entry in the map fails.
     */
    OptimizationResult run_cycle(const std::vector<Strategy>& population,
                                 const std::map<Timeframe, std::vector<PriceSample>>& history) const;

    /**
     * @brief Composite score in [0, 1]
     */
    double score(const PerformanceSummary& summary) const;

    static double score(const PerformanceSummary& summary, const ScoringWeights& weights);

    /**
     * @brief Ranking order: higher score, then lower drawdown, then earlier
     * discovery
     */
    static bool ranks_before(const ScoredStrategy& a, const ScoredStrategy& b);

    const OptimizerConfig& get_config() const {
        return config_;
    }

private:
    using SampleSource = std::function<const std::vector<PriceSample>*(const Strategy&)>;

    OptimizationResult evaluate(const std::vector<Strategy>& population,
                                const SampleSource& samples_for) const;

    OptimizerConfig config_;
    Backtester backtester_;
};

}  // namespace papertrade
