// src/execution/trading_pipeline.cpp
#include "papertrade/execution/trading_pipeline.hpp"
#include <algorithm>
#include "papertrade/core/logger.hpp"
#include "papertrade/strategy/signal_evaluator.hpp"

namespace papertrade {

TradingPipeline::TradingPipeline(PipelineOptions options) : options_(options) {
    if (options_.window_capacity == 0) {
        options_.window_capacity = 1;
    }
    window_.reserve(options_.window_capacity * 2);
}

void TradingPipeline::ensure_capacity(size_t samples) {
    if (samples > options_.window_capacity) {
        options_.window_capacity = samples;
        window_.reserve(samples * 2);
    }
}

size_t TradingPipeline::required_capacity(const Strategy& strategy, const RiskPolicy& policy) {
    size_t needed = SignalEvaluator::lookback(strategy);
    if (policy.stop_mode == StopMode::ATR && policy.atr_period > 0) {
        needed = std::max(needed, static_cast<size_t>(policy.atr_period) + 1);
    }
    return needed;
}

void TradingPipeline::prime(const std::vector<PriceSample>& samples) {
    window_.clear();
    const size_t keep = std::min(samples.size(), options_.window_capacity);
    window_.insert(window_.end(), samples.end() - static_cast<std::ptrdiff_t>(keep),
                   samples.end());
}

void TradingPipeline::record(const PriceSample& sample) {
    window_.push_back(sample);
    // Trim in batches so the vector is not shifted on every sample
    if (window_.size() >= options_.window_capacity * 2) {
        window_.erase(window_.begin(),
                      window_.end() - static_cast<std::ptrdiff_t>(options_.window_capacity));
    }
}

void TradingPipeline::route(const Signal& signal, const RiskManager& risk,
                            PortfolioLedger& ledger, StepOutcome& outcome) {
    auto order = risk.evaluate(signal, ledger.account_snapshot(), window_);
    if (order.is_error()) {
        outcome.rejection = order.error()->code();
        outcome.rejection_reason = order.error()->what();
        if (options_.log_rejections) {
            INFO("Order rejected (" << error_code_to_string(order.error()->code())
                                    << "): " << order.error()->what());
        } else {
            DEBUG("Order rejected (" << error_code_to_string(order.error()->code())
                                     << "): " << order.error()->what());
        }
        return;
    }

    auto applied = ledger.apply_order(order.value());
    if (applied.is_error()) {
        outcome.rejection = applied.error()->code();
        outcome.rejection_reason = applied.error()->what();
        WARN("Ledger refused order: " << applied.error()->to_string());
        return;
    }
    outcome.order = order.take_value();
}

StepOutcome TradingPipeline::step(const PriceSample& sample, const Strategy* strategy,
                                  const RiskManager& risk, PortfolioLedger& ledger) {
    StepOutcome outcome;
    if (strategy != nullptr) {
        ensure_capacity(required_capacity(*strategy, risk.get_policy()));
    }
    record(sample);

    outcome.exit = ledger.check_exits(sample.close, sample.timestamp);

    if (strategy != nullptr) {
        const bool flat = ledger.is_flat();
        if (flat || options_.close_on_opposite_signal) {
            outcome.signal = SignalEvaluator::evaluate(window_, *strategy);
            outcome.evaluated = true;
        }

        if (!outcome.signal.is_flat()) {
            if (flat) {
                route(outcome.signal, risk, ledger, outcome);
            } else {
                auto position = ledger.open_position();
                if (position && outcome.signal.direction != position->order.direction) {
                    Signal close = outcome.signal;
                    close.intent = SignalIntent::CLOSE;
                    route(close, risk, ledger, outcome);
                }
            }
        }
    }

    ledger.mark_to_market(sample.close, sample.timestamp);
    outcome.equity = ledger.equity();
    return outcome;
}

}  // namespace papertrade
