// tests/portfolio/test_performance_metrics.cpp
#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "papertrade/portfolio/performance_metrics.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class PerformanceMetricsTest : public TestBase {
protected:
    std::vector<EquityPoint> curve(const std::vector<double>& values) {
        std::vector<EquityPoint> points;
        for (size_t i = 0; i < values.size(); ++i) {
            points.emplace_back(test_epoch() + std::chrono::hours(static_cast<int>(i)), values[i]);
        }
        return points;
    }

    Trade trade(double pnl, int minutes) {
        Trade t;
        t.direction = Direction::LONG;
        t.entry_time = test_epoch();
        t.exit_time = test_epoch() + std::chrono::minutes(minutes);
        t.realized_pnl = pnl;
        t.fees = 1.0;
        return t;
    }

    PerformanceMetrics metrics_{PerformanceMetrics::periods_per_year(Timeframe::HOUR_1)};
};

TEST_F(PerformanceMetricsTest, TotalReturn) {
    EXPECT_DOUBLE_EQ(metrics_.calculate_total_return(100000.0, 110000.0), 0.10);
    EXPECT_DOUBLE_EQ(metrics_.calculate_total_return(100000.0, 95000.0), -0.05);
    EXPECT_DOUBLE_EQ(metrics_.calculate_total_return(0.0, 100.0), 0.0);
}

TEST_F(PerformanceMetricsTest, MaxDrawdownFromPeak) {
    auto points = curve({100.0, 120.0, 90.0, 130.0, 117.0});
    EXPECT_DOUBLE_EQ(metrics_.calculate_max_drawdown(points), 0.25);
    EXPECT_DOUBLE_EQ(metrics_.calculate_max_drawdown(curve({100.0, 101.0, 102.0})), 0.0);
    EXPECT_DOUBLE_EQ(metrics_.calculate_max_drawdown({}), 0.0);
}

TEST_F(PerformanceMetricsTest, ReturnsFromEquity) {
    auto returns = metrics_.calculate_returns_from_equity(curve({100.0, 110.0, 99.0}));
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_NEAR(returns[0], 0.10, 1e-12);
    EXPECT_NEAR(returns[1], -0.10, 1e-12);
    EXPECT_TRUE(metrics_.calculate_returns_from_equity(curve({100.0})).empty());
}

TEST_F(PerformanceMetricsTest, SharpeIsZeroForFlatCurve) {
    auto returns = metrics_.calculate_returns_from_equity(curve({100.0, 100.0, 100.0, 100.0}));
    EXPECT_DOUBLE_EQ(metrics_.calculate_volatility(returns), 0.0);
    EXPECT_DOUBLE_EQ(metrics_.calculate_sharpe_ratio(returns), 0.0);
}

TEST_F(PerformanceMetricsTest, SharpeSignFollowsMeanReturn) {
    std::vector<double> rising{0.01, 0.02, -0.005, 0.015};
    std::vector<double> falling{-0.01, -0.02, 0.005, -0.015};
    EXPECT_GT(metrics_.calculate_sharpe_ratio(rising), 0.0);
    EXPECT_LT(metrics_.calculate_sharpe_ratio(falling), 0.0);

    // Annualization scales with the sampling frequency
    PerformanceMetrics daily(PerformanceMetrics::periods_per_year(Timeframe::DAILY));
    EXPECT_NEAR(metrics_.calculate_sharpe_ratio(rising) / daily.calculate_sharpe_ratio(rising),
                std::sqrt(24.0), 1e-9);
}

TEST_F(PerformanceMetricsTest, PeriodsPerYear) {
    EXPECT_DOUBLE_EQ(PerformanceMetrics::periods_per_year(Timeframe::DAILY), 365.0);
    EXPECT_DOUBLE_EQ(PerformanceMetrics::periods_per_year(Timeframe::HOUR_1), 365.0 * 24);
    EXPECT_DOUBLE_EQ(PerformanceMetrics::periods_per_year(Timeframe::MINUTE_5), 365.0 * 288);
}

TEST_F(PerformanceMetricsTest, SummaryTradeStatistics) {
    Portfolio portfolio;
    portfolio.starting_balance = 100000.0;
    portfolio.cash = 100500.0;
    portfolio.trades = {trade(400.0, 10), trade(-200.0, 20), trade(300.0, 30)};
    portfolio.equity_curve = curve({100000.0, 100400.0, 100200.0, 100500.0});

    PerformanceSummary summary = metrics_.summarize(portfolio);
    EXPECT_NEAR(summary.total_return, 0.005, 1e-12);
    EXPECT_EQ(summary.total_trades, 3);
    EXPECT_EQ(summary.winning_trades, 2);
    EXPECT_NEAR(summary.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(summary.avg_win, 350.0);
    EXPECT_DOUBLE_EQ(summary.avg_loss, 200.0);
    EXPECT_DOUBLE_EQ(summary.profit_factor, 3.5);
    EXPECT_DOUBLE_EQ(summary.realized_pnl, 500.0);
    EXPECT_DOUBLE_EQ(summary.total_fees, 3.0);
    EXPECT_DOUBLE_EQ(summary.avg_trade_duration_sec, 1200.0);
    EXPECT_GT(summary.max_drawdown, 0.0);

    auto j = summary.to_json();
    EXPECT_EQ(j.at("total_trades").get<int>(), 3);
}

TEST_F(PerformanceMetricsTest, SummaryOfEmptyPortfolio) {
    Portfolio portfolio;
    PerformanceSummary summary = metrics_.summarize(portfolio);
    EXPECT_EQ(summary.total_trades, 0);
    EXPECT_DOUBLE_EQ(summary.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(summary.total_return, 0.0);
    EXPECT_DOUBLE_EQ(summary.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(summary.profit_factor, 0.0);
}
