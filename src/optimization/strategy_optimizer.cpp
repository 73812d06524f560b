// src/optimization/strategy_optimizer.cpp
#include "papertrade/optimization/strategy_optimizer.hpp"
#include <algorithm>
#include <future>
#include <optional>
#include "papertrade/core/logger.hpp"

namespace papertrade {

namespace {

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

struct CandidateOutcome {
    const Strategy* strategy{nullptr};
    std::optional<BacktestResult> result;
    std::string error;
};

}  // namespace

nlohmann::json ScoringWeights::to_json() const {
    nlohmann::json j;
    j["return_weight"] = return_weight;
    j["win_rate_weight"] = win_rate_weight;
    j["sharpe_weight"] = sharpe_weight;
    j["drawdown_weight"] = drawdown_weight;
    j["return_target"] = return_target;
    j["sharpe_target"] = sharpe_target;
    j["max_drawdown_tolerance"] = max_drawdown_tolerance;
    j["min_trades"] = min_trades;
    return j;
}

void ScoringWeights::from_json(const nlohmann::json& j) {
    if (j.contains("return_weight"))
        return_weight = j.at("return_weight").get<double>();
    if (j.contains("win_rate_weight"))
        win_rate_weight = j.at("win_rate_weight").get<double>();
    if (j.contains("sharpe_weight"))
        sharpe_weight = j.at("sharpe_weight").get<double>();
    if (j.contains("drawdown_weight"))
        drawdown_weight = j.at("drawdown_weight").get<double>();
    if (j.contains("return_target"))
        return_target = j.at("return_target").get<double>();
    if (j.contains("sharpe_target"))
        sharpe_target = j.at("sharpe_target").get<double>();
    if (j.contains("max_drawdown_tolerance"))
        max_drawdown_tolerance = j.at("max_drawdown_tolerance").get<double>();
    if (j.contains("min_trades"))
        min_trades = j.at("min_trades").get<int>();
}

Result<void> ScoringWeights::validate() const {
    if (return_weight < 0.0 || win_rate_weight < 0.0 || sharpe_weight < 0.0 ||
        drawdown_weight < 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "Scoring weights must be non-negative", "ScoringWeights");
    }
    if (return_weight + win_rate_weight + sharpe_weight + drawdown_weight <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "At least one scoring weight must be positive", "ScoringWeights");
    }
    if (return_target <= 0.0 || sharpe_target <= 0.0 || max_drawdown_tolerance <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "Scoring targets must be positive", "ScoringWeights");
    }
    if (min_trades < 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "min_trades cannot be negative", "ScoringWeights");
    }
    return Result<void>();
}

nlohmann::json OptimizerConfig::to_json() const {
    nlohmann::json j;
    j["max_parallel_evaluations"] = max_parallel_evaluations;
    j["top_n"] = top_n;
    j["close_on_opposite_signal"] = close_on_opposite_signal;
    j["scoring"] = scoring.to_json();
    return j;
}

void OptimizerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_parallel_evaluations"))
        max_parallel_evaluations = j.at("max_parallel_evaluations").get<size_t>();
    if (j.contains("top_n"))
        top_n = j.at("top_n").get<size_t>();
    if (j.contains("close_on_opposite_signal"))
        close_on_opposite_signal = j.at("close_on_opposite_signal").get<bool>();
    if (j.contains("scoring"))
        scoring.from_json(j.at("scoring"));
}

Result<void> OptimizerConfig::validate() const {
    if (max_parallel_evaluations == 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "max_parallel_evaluations must be at least 1", "OptimizerConfig");
    }
    if (top_n == 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, "top_n must be at least 1",
                                "OptimizerConfig");
    }
    return scoring.validate();
}

nlohmann::json ScoredStrategy::to_json() const {
    nlohmann::json j;
    j["strategy"] = strategy_to_json(strategy);
    j["score"] = score;
    j["backtest"] = backtest.to_json();
    return j;
}

std::vector<ScoredStrategy> OptimizationResult::winners() const {
    size_t count = std::min(top_n, ranked.size());
    return std::vector<ScoredStrategy>(ranked.begin(),
                                       ranked.begin() + static_cast<std::ptrdiff_t>(count));
}

const ScoredStrategy* OptimizationResult::find(const std::string& strategy_id) const {
    for (const auto& candidate : ranked) {
        if (candidate.strategy.id == strategy_id) {
            return &candidate;
        }
    }
    return nullptr;
}

StrategyOptimizer::StrategyOptimizer(OptimizerConfig config, RiskPolicy policy)
    : config_(std::move(config)),
      backtester_(std::move(policy), config_.close_on_opposite_signal) {
    if (config_.max_parallel_evaluations == 0) {
        config_.max_parallel_evaluations = 1;
    }
}

double StrategyOptimizer::score(const PerformanceSummary& summary) const {
    return score(summary, config_.scoring);
}

double StrategyOptimizer::score(const PerformanceSummary& summary, const ScoringWeights& weights) {
    const bool reliable = summary.total_trades >= weights.min_trades;

    const double return_score = clamp01(summary.total_return / weights.return_target);
    const double win_score = reliable ? clamp01(summary.win_rate) : 0.0;
    const double sharpe_score =
        reliable ? clamp01(summary.sharpe_ratio / weights.sharpe_target) : 0.0;
    const double drawdown_score =
        clamp01(1.0 - summary.max_drawdown / weights.max_drawdown_tolerance);

    const double total_weight = weights.return_weight + weights.win_rate_weight +
                                weights.sharpe_weight + weights.drawdown_weight;
    if (total_weight <= 0.0) {
        return 0.0;
    }

    const double weighted = return_score * weights.return_weight +
                            win_score * weights.win_rate_weight +
                            sharpe_score * weights.sharpe_weight +
                            drawdown_score * weights.drawdown_weight;
    return clamp01(weighted / total_weight);
}

bool StrategyOptimizer::ranks_before(const ScoredStrategy& a, const ScoredStrategy& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.backtest.summary.max_drawdown != b.backtest.summary.max_drawdown) {
        return a.backtest.summary.max_drawdown < b.backtest.summary.max_drawdown;
    }
    if (a.strategy.discovery_seq != b.strategy.discovery_seq) {
        return a.strategy.discovery_seq < b.strategy.discovery_seq;
    }
    return a.strategy.id < b.strategy.id;
}

OptimizationResult StrategyOptimizer::run_cycle(const std::vector<Strategy>& population,
                                                const std::vector<PriceSample>& samples) const {
    return evaluate(population, [&samples](const Strategy&) { return &samples; });
}

OptimizationResult StrategyOptimizer::run_cycle(
    const std::vector<Strategy>& population,
    const std::map<Timeframe, std::vector<PriceSample>>& history) const {
    return evaluate(population,
                    [&history](const Strategy& strategy) -> const std::vector<PriceSample>* {
                        auto it = history.find(strategy.timeframe);
                        return it == history.end() ? nullptr : &it->second;
                    });
}

OptimizationResult StrategyOptimizer::evaluate(const std::vector<Strategy>& population,
                                               const SampleSource& samples_for) const {
    OptimizationResult result;
    result.top_n = config_.top_n;
    result.evaluated = population.size();

    std::vector<CandidateOutcome> outcomes(population.size());

    // Bounded fan-out: at most max_parallel_evaluations backtests in flight
    for (size_t begin = 0; begin < population.size();
         begin += config_.max_parallel_evaluations) {
        size_t end = std::min(population.size(), begin + config_.max_parallel_evaluations);

        std::vector<std::future<Result<BacktestResult>>> futures;
        futures.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            const Strategy* candidate = &population[i];
            const std::vector<PriceSample>* samples = samples_for(*candidate);
            if (samples == nullptr) {
                std::promise<Result<BacktestResult>> missing;
                missing.set_value(make_error<BacktestResult>(
                    ErrorCode::DATA_NOT_FOUND,
                    "No " + timeframe_to_string(candidate->timeframe) + " history",
                    "StrategyOptimizer"));
                futures.push_back(missing.get_future());
                continue;
            }
            futures.push_back(std::async(std::launch::async, [this, candidate, samples]() {
                return backtester_.run(*candidate, *samples);
            }));
        }

        for (size_t i = begin; i < end; ++i) {
            CandidateOutcome& outcome = outcomes[i];
            outcome.strategy = &population[i];
            try {
                auto backtest = futures[i - begin].get();
                if (backtest.is_error()) {
                    outcome.error = backtest.error()->to_string();
                } else {
                    outcome.result = backtest.take_value();
                }
            } catch (const std::exception& e) {
                outcome.error = e.what();
            }
        }
    }

    for (auto& outcome : outcomes) {
        if (!outcome.result) {
            ++result.failed;
            result.failed_ids.push_back(outcome.strategy->id);
            WARN("Candidate " << outcome.strategy->id << " excluded: " << outcome.error);
            continue;
        }
        ScoredStrategy scored;
        scored.strategy = *outcome.strategy;
        scored.score = score(outcome.result->summary);
        scored.backtest = std::move(*outcome.result);
        result.ranked.push_back(std::move(scored));
    }

    std::sort(result.ranked.begin(), result.ranked.end(), &StrategyOptimizer::ranks_before);

    if (!result.ranked.empty()) {
        const auto& best = result.ranked.front();
        INFO("Evaluated " << result.evaluated << " strategies (" << result.failed
                          << " failed), best " << best.strategy.id << " score " << best.score);
    } else {
        WARN("Evaluated " << result.evaluated << " strategies, none succeeded");
    }
    return result;
}

}  // namespace papertrade
