// src/strategy/strategy_catalog.cpp
#include "papertrade/strategy/strategy_catalog.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <type_traits>
#include "papertrade/core/logger.hpp"

namespace papertrade {

namespace {

struct NamedParams {
    const char* name;
    StrategyParams params;
};

std::vector<NamedParams> default_parameter_sets() {
    return {
        {"RSI_Momentum", RsiParams{14, 30.0, 70.0}},
        {"RSI_Adaptive", RsiParams{21, 25.0, 75.0}},
        {"MACD_Standard", MacdParams{12, 26, 9}},
        {"MACD_Aggressive", MacdParams{8, 21, 6}},
        {"SMA_Cross_Fast", MaCrossoverParams{5, 15, false, 1.0, 1.0}},
        {"SMA_Cross_Medium", MaCrossoverParams{10, 30, false, 1.0, 1.0}},
        {"SMA_Cross_Slow", MaCrossoverParams{20, 50, false, 1.0, 1.0}},
        {"EMA_Cross", MaCrossoverParams{12, 26, true, 1.0, 1.0}},
        {"Trend_Sensitive", MaCrossoverParams{5, 20, false, 1.01, 0.99}},
        {"Bollinger_Bands", MeanReversionParams{20, 2.0}},
        {"Bollinger_Tight", MeanReversionParams{10, 1.5}},
        {"Momentum_Fast", MomentumParams{10, 0.02}},
        {"Momentum_Slow", MomentumParams{50, 0.05}},
    };
}

int nudge(std::mt19937_64& rng, int value, int min_value) {
    std::uniform_int_distribution<int> step(-std::max(1, value / 5), std::max(1, value / 5));
    return std::max(min_value, value + step(rng));
}

double nudge(std::mt19937_64& rng, double value, double relative, double min_value) {
    std::uniform_real_distribution<double> factor(1.0 - relative, 1.0 + relative);
    // Round so ids stay readable and repeatable
    double v = std::round(value * factor(rng) * 1000.0) / 1000.0;
    return std::max(min_value, v);
}

}  // namespace

StrategyCatalog::StrategyCatalog(uint64_t seed) : rng_(seed) {}

void StrategyCatalog::observe_sequence(uint64_t seq) {
    uint64_t current = next_seq_.load();
    while (current <= seq && !next_seq_.compare_exchange_weak(current, seq + 1)) {
    }
}

std::vector<Strategy> StrategyCatalog::default_population(Timeframe timeframe) {
    std::vector<Strategy> population;
    for (const auto& entry : default_parameter_sets()) {
        auto strategy = make_strategy(entry.params, timeframe, next_seq_.fetch_add(1), entry.name);
        if (strategy.is_error()) {
            ERROR("Default strategy " << entry.name << " rejected: " << strategy.error()->what());
            continue;
        }
        population.push_back(strategy.take_value());
    }
    return population;
}

StrategyParams StrategyCatalog::perturb_params(const StrategyParams& params) {
    return std::visit(
        [this](const auto& p) -> StrategyParams {
            using T = std::decay_t<decltype(p)>;
            T q = p;
            if constexpr (std::is_same_v<T, MeanReversionParams>) {
                q.window = nudge(rng_, p.window, 2);
                q.std_multiplier = nudge(rng_, p.std_multiplier, 0.2, 0.5);
            } else if constexpr (std::is_same_v<T, MaCrossoverParams>) {
                q.fast = nudge(rng_, p.fast, 1);
                q.slow = std::max(q.fast + 1, nudge(rng_, p.slow, 2));
            } else if constexpr (std::is_same_v<T, RsiParams>) {
                q.period = nudge(rng_, p.period, 2);
                q.oversold = std::round(nudge(rng_, p.oversold, 0.15, 5.0));
                q.overbought = std::round(std::min(95.0, nudge(rng_, p.overbought, 0.1, 55.0)));
            } else if constexpr (std::is_same_v<T, MacdParams>) {
                q.fast = nudge(rng_, p.fast, 1);
                q.slow = std::max(q.fast + 1, nudge(rng_, p.slow, 2));
                q.signal = nudge(rng_, p.signal, 1);
            } else {
                q.window = nudge(rng_, p.window, 1);
                q.threshold = nudge(rng_, p.threshold, 0.25, 0.001);
            }
            return q;
        },
        params);
}

std::vector<Strategy> StrategyCatalog::perturb(const Strategy& base, size_t count) {
    std::vector<Strategy> variants;
    std::set<std::string> seen{base.id};

    // Bounded retries, small parameter spaces run out of fresh neighbours
    const size_t max_attempts = count * 5;
    for (size_t attempt = 0; attempt < max_attempts && variants.size() < count; ++attempt) {
        StrategyParams params = perturb_params(base.params);
        if (validate_params(params).is_error()) {
            continue;
        }
        std::string id = make_strategy_id(params, base.timeframe);
        if (!seen.insert(id).second) {
            continue;
        }
        auto strategy = make_strategy(params, base.timeframe, next_seq_.fetch_add(1), "",
                                      base.version + 1);
        if (strategy.is_ok()) {
            variants.push_back(strategy.take_value());
        }
    }

    DEBUG("Derived " << variants.size() << " variants from " << base.id);
    return variants;
}

}  // namespace papertrade
