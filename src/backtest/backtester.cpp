// src/backtest/backtester.cpp
#include "papertrade/backtest/backtester.hpp"
#include "papertrade/core/logger.hpp"
#include "papertrade/execution/trading_pipeline.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"
#include "papertrade/strategy/signal_evaluator.hpp"

namespace papertrade {

nlohmann::json BacktestResult::to_json() const {
    nlohmann::json j;
    j["strategy_id"] = strategy_id;
    j["summary"] = summary.to_json();
    j["samples_processed"] = samples_processed;
    j["orders"] = orders;
    j["rejections"] = rejections;
    j["trades"] = trades.size();
    return j;
}

Backtester::Backtester(RiskPolicy policy, bool close_on_opposite_signal)
    : risk_(std::move(policy)), close_on_opposite_signal_(close_on_opposite_signal) {}

Result<BacktestResult> Backtester::run(const Strategy& strategy,
                                       const std::vector<PriceSample>& samples) const {
    auto valid = validate_params(strategy.params);
    if (valid.is_error()) {
        return forward_error<BacktestResult>(valid);
    }

    const size_t lookback = SignalEvaluator::lookback(strategy);
    if (samples.size() < lookback) {
        return make_error<BacktestResult>(
            ErrorCode::INSUFFICIENT_DATA,
            strategy.id + " needs " + std::to_string(lookback) + " samples, got " +
                std::to_string(samples.size()),
            "Backtester");
    }

    const RiskPolicy& policy = risk_.get_policy();
    PortfolioLedger ledger(policy.starting_balance, policy.ledger_limits());

    PipelineOptions options;
    options.window_capacity = TradingPipeline::required_capacity(strategy, policy);
    options.close_on_opposite_signal = close_on_opposite_signal_;
    options.log_rejections = false;
    TradingPipeline pipeline(options);

    BacktestResult result;
    result.strategy_id = strategy.id;

    for (const auto& sample : samples) {
        StepOutcome outcome = pipeline.step(sample, &strategy, risk_, ledger);
        ++result.samples_processed;
        if (outcome.order) {
            ++result.orders;
        }
        if (outcome.rejection) {
            ++result.rejections;
        }
    }

    if (!ledger.is_flat()) {
        const PriceSample& last = samples.back();
        auto closed = ledger.close_position(last.close, last.timestamp, ExitReason::MANUAL);
        if (closed.is_error()) {
            return forward_error<BacktestResult>(closed);
        }
    }

    Portfolio portfolio = ledger.snapshot();
    PerformanceMetrics metrics(PerformanceMetrics::periods_per_year(strategy.timeframe));
    result.summary = metrics.summarize(portfolio);
    result.equity_curve = std::move(portfolio.equity_curve);
    result.trades = std::move(portfolio.trades);

    DEBUG("Backtest " << strategy.id << ": " << result.summary.total_trades << " trades, return "
                      << result.summary.total_return << ", max drawdown "
                      << result.summary.max_drawdown);
    return result;
}

}  // namespace papertrade
