// src/strategy/signal_evaluator.cpp
#include "papertrade/strategy/signal_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>
#include <variant>

namespace papertrade {

namespace indicators {

std::optional<double> sma(const std::vector<double>& values, size_t n, size_t end) {
    if (n == 0 || end > values.size() || end < n) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (size_t i = end - n; i < end; ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(n);
}

std::vector<double> ema_series(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), std::numeric_limits<double>::quiet_NaN());
    const size_t n = static_cast<size_t>(period);
    if (period < 1 || values.size() < n) {
        return out;
    }

    const double alpha = 2.0 / (period + 1.0);
    double ema = *sma(values, n, n);
    out[n - 1] = ema;
    for (size_t i = n; i < values.size(); ++i) {
        ema = alpha * values[i] + (1.0 - alpha) * ema;
        out[i] = ema;
    }
    return out;
}

std::optional<double> stddev(const std::vector<double>& values, size_t n, size_t end) {
    auto mean = sma(values, n, end);
    if (!mean) {
        return std::nullopt;
    }
    double sum_sq = 0.0;
    for (size_t i = end - n; i < end; ++i) {
        double d = values[i] - *mean;
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq / static_cast<double>(n));
}

std::optional<double> rsi(const std::vector<double>& closes, int period) {
    if (period < 1 || closes.size() < static_cast<size_t>(period) + 1) {
        return std::nullopt;
    }

    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0.0) {
            gains += change;
        } else {
            losses -= change;
        }
    }

    if (gains == 0.0 && losses == 0.0) {
        return 50.0;
    }
    if (losses == 0.0) {
        return 100.0;
    }
    double rs = (gains / period) / (losses / period);
    return 100.0 - 100.0 / (1.0 + rs);
}

std::optional<double> atr(const std::vector<PriceSample>& window, int period) {
    if (period < 1 || window.size() < static_cast<size_t>(period) + 1) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (size_t i = window.size() - period; i < window.size(); ++i) {
        const auto& bar = window[i];
        double prev_close = window[i - 1].close;
        double tr = std::max({bar.high - bar.low, std::abs(bar.high - prev_close),
                              std::abs(bar.low - prev_close)});
        sum += tr;
    }
    return sum / period;
}

std::vector<double> closes(const std::vector<PriceSample>& window) {
    std::vector<double> out;
    out.reserve(window.size());
    for (const auto& sample : window) {
        out.push_back(sample.close);
    }
    return out;
}

}  // namespace indicators

namespace {

constexpr double MAX_CONFIDENCE = 0.95;

double cap(double confidence) {
    return std::clamp(confidence, 0.0, MAX_CONFIDENCE);
}

Signal make_signal(Direction direction, double confidence, std::string reason) {
    Signal signal;
    signal.direction = direction;
    signal.confidence = cap(confidence);
    signal.reason = std::move(reason);
    return signal;
}

}  // namespace

size_t SignalEvaluator::lookback(const StrategyParams& params) {
    return std::visit(
        [](const auto& p) -> size_t {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, MeanReversionParams>) {
                return static_cast<size_t>(p.window);
            } else if constexpr (std::is_same_v<T, MaCrossoverParams>) {
                // EMAs need a warm-up tail for their value to settle
                return static_cast<size_t>(p.exponential ? 3 * p.slow + 1 : p.slow + 1);
            } else if constexpr (std::is_same_v<T, RsiParams>) {
                return static_cast<size_t>(p.period + 1);
            } else if constexpr (std::is_same_v<T, MacdParams>) {
                return static_cast<size_t>(3 * p.slow + p.signal);
            } else {
                return static_cast<size_t>(p.window + 1);
            }
        },
        params);
}

Signal SignalEvaluator::evaluate(const std::vector<PriceSample>& window, const Strategy& strategy) {
    const size_t needed = lookback(strategy.params);
    if (window.empty()) {
        return Signal::none(strategy.id, Timestamp{});
    }

    const Timestamp ts = window.back().timestamp;
    if (window.size() < needed) {
        return Signal::none(strategy.id, ts);
    }

    std::vector<double> tail;
    tail.reserve(needed);
    for (size_t i = window.size() - needed; i < window.size(); ++i) {
        tail.push_back(window[i].close);
    }

    Signal signal = std::visit([&tail](const auto& p) { return evaluate(tail, p); },
                               strategy.params);
    signal.strategy_id = strategy.id;
    signal.timestamp = ts;
    if (signal.is_flat()) {
        signal.confidence = 0.0;
    }
    return signal;
}

Signal SignalEvaluator::evaluate(const std::vector<double>& closes, const MeanReversionParams& p) {
    const double price = closes.back();
    auto mean = indicators::sma(closes, p.window, closes.size());
    auto sd = indicators::stddev(closes, p.window, closes.size());
    if (!mean || !sd || *sd <= 0.0) {
        return Signal{};
    }

    const double upper = *mean + *sd * p.std_multiplier;
    const double lower = *mean - *sd * p.std_multiplier;

    std::ostringstream reason;
    if (price < lower) {
        reason << "Price " << price << " below lower band " << lower;
        return make_signal(Direction::LONG, (lower - price) / price * 100.0, reason.str());
    }
    if (price > upper) {
        reason << "Price " << price << " above upper band " << upper;
        return make_signal(Direction::SHORT, (price - upper) / price * 100.0, reason.str());
    }
    return Signal{};
}

Signal SignalEvaluator::evaluate(const std::vector<double>& closes, const MaCrossoverParams& p) {
    const size_t n = closes.size();
    double fast, slow, prev_fast, prev_slow;

    if (p.exponential) {
        auto fast_ema = indicators::ema_series(closes, p.fast);
        auto slow_ema = indicators::ema_series(closes, p.slow);
        fast = fast_ema[n - 1];
        slow = slow_ema[n - 1];
        prev_fast = fast_ema[n - 2];
        prev_slow = slow_ema[n - 2];
    } else {
        fast = *indicators::sma(closes, p.fast, n);
        slow = *indicators::sma(closes, p.slow, n);
        prev_fast = *indicators::sma(closes, p.fast, n - 1);
        prev_slow = *indicators::sma(closes, p.slow, n - 1);
    }

    if (std::isnan(prev_fast) || std::isnan(prev_slow) || slow <= 0.0) {
        return Signal{};
    }

    const double strength = std::abs((fast - slow) / slow * 100.0) * 10.0;
    std::ostringstream reason;
    if (prev_fast <= prev_slow * p.crossover_threshold && fast > slow * p.crossover_threshold) {
        reason << "Bullish crossover: fast " << fast << " > slow " << slow << " * "
               << p.crossover_threshold;
        return make_signal(Direction::LONG, strength, reason.str());
    }
    if (prev_fast >= prev_slow * p.crossunder_threshold && fast < slow * p.crossunder_threshold) {
        reason << "Bearish crossover: fast " << fast << " < slow " << slow << " * "
               << p.crossunder_threshold;
        return make_signal(Direction::SHORT, strength, reason.str());
    }
    return Signal{};
}

Signal SignalEvaluator::evaluate(const std::vector<double>& closes, const RsiParams& p) {
    auto value = indicators::rsi(closes, p.period);
    if (!value) {
        return Signal{};
    }

    std::ostringstream reason;
    if (*value < p.oversold) {
        reason << "RSI " << *value << " below oversold " << p.oversold;
        return make_signal(Direction::LONG, 0.5 + (p.oversold - *value) / p.oversold,
                           reason.str());
    }
    if (*value > p.overbought) {
        reason << "RSI " << *value << " above overbought " << p.overbought;
        return make_signal(Direction::SHORT,
                           0.5 + (*value - p.overbought) / (100.0 - p.overbought), reason.str());
    }
    return Signal{};
}

Signal SignalEvaluator::evaluate(const std::vector<double>& closes, const MacdParams& p) {
    auto fast = indicators::ema_series(closes, p.fast);
    auto slow = indicators::ema_series(closes, p.slow);

    std::vector<double> macd;
    for (size_t i = static_cast<size_t>(p.slow) - 1; i < closes.size(); ++i) {
        macd.push_back(fast[i] - slow[i]);
    }

    // Signal line is the simple mean of the last `signal` MACD values
    if (macd.size() < static_cast<size_t>(p.signal) + 1) {
        return Signal{};
    }
    const double line = macd.back();
    const double prev_line = macd[macd.size() - 2];
    const double signal_line = *indicators::sma(macd, p.signal, macd.size());
    const double prev_signal_line = *indicators::sma(macd, p.signal, macd.size() - 1);

    const double price = closes.back();
    const double confidence = 0.5 + std::abs(line - signal_line) / price * 100.0;
    std::ostringstream reason;
    if (prev_line <= prev_signal_line && line > signal_line) {
        reason << "MACD " << line << " crossed above signal " << signal_line;
        return make_signal(Direction::LONG, confidence, reason.str());
    }
    if (prev_line >= prev_signal_line && line < signal_line) {
        reason << "MACD " << line << " crossed below signal " << signal_line;
        return make_signal(Direction::SHORT, confidence, reason.str());
    }
    return Signal{};
}

Signal SignalEvaluator::evaluate(const std::vector<double>& closes, const MomentumParams& p) {
    const double past = closes[closes.size() - 1 - p.window];
    if (past <= 0.0) {
        return Signal{};
    }
    const double change = closes.back() / past - 1.0;

    std::ostringstream reason;
    if (change > p.threshold) {
        reason << "Momentum " << change * 100.0 << "% over " << p.window << " bars";
        return make_signal(Direction::LONG, 0.5 * change / p.threshold, reason.str());
    }
    if (change < -p.threshold) {
        reason << "Momentum " << change * 100.0 << "% over " << p.window << " bars";
        return make_signal(Direction::SHORT, 0.5 * -change / p.threshold, reason.str());
    }
    return Signal{};
}

}  // namespace papertrade
