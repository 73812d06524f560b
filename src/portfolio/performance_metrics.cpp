// src/portfolio/performance_metrics.cpp
#include "papertrade/portfolio/performance_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace papertrade {

nlohmann::json PerformanceSummary::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["sharpe_ratio"] = sharpe_ratio;
    j["max_drawdown"] = max_drawdown;
    j["volatility"] = volatility;
    j["total_trades"] = total_trades;
    j["winning_trades"] = winning_trades;
    j["win_rate"] = win_rate;
    j["profit_factor"] = profit_factor;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    j["realized_pnl"] = realized_pnl;
    j["total_fees"] = total_fees;
    j["avg_trade_duration_sec"] = avg_trade_duration_sec;
    return j;
}

double PerformanceMetrics::periods_per_year(Timeframe timeframe) {
    constexpr double DAYS = 365.0;
    switch (timeframe) {
        case Timeframe::SECOND_1:
            return DAYS * 24 * 3600;
        case Timeframe::MINUTE_1:
            return DAYS * 24 * 60;
        case Timeframe::MINUTE_5:
            return DAYS * 24 * 12;
        case Timeframe::MINUTE_15:
            return DAYS * 24 * 4;
        case Timeframe::HOUR_1:
            return DAYS * 24;
        case Timeframe::HOUR_4:
            return DAYS * 6;
        default:
            return DAYS;
    }
}

double PerformanceMetrics::calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double PerformanceMetrics::calculate_total_return(double start_value, double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

std::vector<double> PerformanceMetrics::calculate_returns_from_equity(
    const std::vector<EquityPoint>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1].second > 0.0) {
            returns.push_back((equity_curve[i].second - equity_curve[i - 1].second) /
                              equity_curve[i - 1].second);
        }
    }
    return returns;
}

double PerformanceMetrics::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double sq_sum = std::inner_product(returns.begin(), returns.end(), returns.begin(), 0.0);
    double variance = std::max(0.0, sq_sum / returns.size() - mean_return * mean_return);
    return std::sqrt(variance) * std::sqrt(periods_per_year_);
}

double PerformanceMetrics::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                  double risk_free_rate) const {
    double volatility = calculate_volatility(returns);
    // Guard against rounding noise on a constant curve
    if (volatility <= 1e-12) {
        return 0.0;
    }
    double annualized_return = calculate_mean(returns) * periods_per_year_;
    return (annualized_return - risk_free_rate) / volatility;
}

double PerformanceMetrics::calculate_max_drawdown(
    const std::vector<EquityPoint>& equity_curve) const {
    if (equity_curve.empty()) {
        return 0.0;
    }

    double peak = equity_curve.front().second;
    double max_drawdown = 0.0;
    for (const auto& [_, equity] : equity_curve) {
        peak = std::max(peak, equity);
        if (peak > 0.0 && equity < peak) {
            max_drawdown = std::max(max_drawdown, (peak - equity) / peak);
        }
    }
    return max_drawdown;
}

PerformanceSummary PerformanceMetrics::summarize(const Portfolio& portfolio) const {
    PerformanceSummary summary;

    summary.total_return =
        calculate_total_return(portfolio.starting_balance, portfolio.equity());

    auto returns = calculate_returns_from_equity(portfolio.equity_curve);
    summary.volatility = calculate_volatility(returns);
    summary.sharpe_ratio = calculate_sharpe_ratio(returns);
    summary.max_drawdown = calculate_max_drawdown(portfolio.equity_curve);

    double total_profit = 0.0;
    double total_loss = 0.0;
    double total_duration = 0.0;
    for (const auto& trade : portfolio.trades) {
        summary.realized_pnl += trade.realized_pnl;
        summary.total_fees += trade.fees;
        total_duration += static_cast<double>(trade.duration().count());
        if (trade.is_win()) {
            ++summary.winning_trades;
            total_profit += trade.realized_pnl;
        } else {
            total_loss -= trade.realized_pnl;
        }
    }

    summary.total_trades = static_cast<int>(portfolio.trades.size());
    if (summary.total_trades > 0) {
        summary.win_rate = static_cast<double>(summary.winning_trades) / summary.total_trades;
        summary.avg_trade_duration_sec = total_duration / summary.total_trades;
        summary.avg_win = summary.winning_trades > 0 ? total_profit / summary.winning_trades : 0.0;
        int losing_trades = summary.total_trades - summary.winning_trades;
        summary.avg_loss = losing_trades > 0 ? total_loss / losing_trades : 0.0;
    }

    if (total_loss > 0.0) {
        summary.profit_factor = total_profit / total_loss;
    } else if (total_profit > 0.0) {
        summary.profit_factor = 999.0;
    }

    return summary;
}

}  // namespace papertrade
