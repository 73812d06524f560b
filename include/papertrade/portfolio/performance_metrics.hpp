// include/papertrade/portfolio/performance_metrics.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "papertrade/core/types.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"

namespace papertrade {

/**
 * @brief Read-only views derived from a portfolio's trades and equity curve
 */
struct PerformanceSummary {
    double total_return{0.0};
    double sharpe_ratio{0.0};
    double max_drawdown{0.0};
    double volatility{0.0};
    int total_trades{0};
    int winning_trades{0};
    double win_rate{0.0};
    double profit_factor{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    double realized_pnl{0.0};
    double total_fees{0.0};
    double avg_trade_duration_sec{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Pure stateless calculations over equity curves and trades
 *
 * Returns are per equity point. Annualization uses the number of points
 * per year of the timeframe the curve was sampled at, with crypto markets
 * trading every day of the year.
 */
class PerformanceMetrics {
public:
    PerformanceMetrics() = default;

    /**
     * @param periods_per_year Annualization factor for Sharpe and volatility
     */
    explicit PerformanceMetrics(double periods_per_year) : periods_per_year_(periods_per_year) {}

    static double periods_per_year(Timeframe timeframe);

    double calculate_total_return(double start_value, double end_value) const;

    std::vector<double> calculate_returns_from_equity(
        const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Annualized mean over annualized volatility, 0 when flat
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double risk_free_rate = 0.0) const;

    double calculate_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Largest peak-to-trough decline as a fraction of the peak
     */
    double calculate_max_drawdown(const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Trade statistics plus curve metrics for a whole portfolio
     */
    PerformanceSummary summarize(const Portfolio& portfolio) const;

private:
    static double calculate_mean(const std::vector<double>& values);

    double periods_per_year_{365.0};
};

}  // namespace papertrade
