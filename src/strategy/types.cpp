// src/strategy/types.cpp
#include "papertrade/strategy/types.hpp"
#include <iomanip>
#include <sstream>

namespace papertrade {

namespace {

// Shortest decimal form with up to four places, "1.50" -> "1.5", "2.0" -> "2"
std::string compact(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    std::string s = ss.str();
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Result<void> invalid(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "Strategy");
}

}  // namespace

std::string strategy_family_to_string(StrategyFamily family) {
    switch (family) {
        case StrategyFamily::MEAN_REVERSION:
            return "MEAN_REVERSION";
        case StrategyFamily::MA_CROSSOVER:
            return "MA_CROSSOVER";
        case StrategyFamily::RSI:
            return "RSI";
        case StrategyFamily::MACD:
            return "MACD";
        default:
            return "MOMENTUM";
    }
}

std::optional<StrategyFamily> strategy_family_from_string(const std::string& s) {
    if (s == "MEAN_REVERSION")
        return StrategyFamily::MEAN_REVERSION;
    if (s == "MA_CROSSOVER")
        return StrategyFamily::MA_CROSSOVER;
    if (s == "RSI")
        return StrategyFamily::RSI;
    if (s == "MACD")
        return StrategyFamily::MACD;
    if (s == "MOMENTUM")
        return StrategyFamily::MOMENTUM;
    return std::nullopt;
}

StrategyFamily family_of(const StrategyParams& params) {
    return std::visit(overloaded{
                          [](const MeanReversionParams&) { return StrategyFamily::MEAN_REVERSION; },
                          [](const MaCrossoverParams&) { return StrategyFamily::MA_CROSSOVER; },
                          [](const RsiParams&) { return StrategyFamily::RSI; },
                          [](const MacdParams&) { return StrategyFamily::MACD; },
                          [](const MomentumParams&) { return StrategyFamily::MOMENTUM; },
                      },
                      params);
}

Result<void> validate_params(const StrategyParams& params) {
    return std::visit(
        overloaded{
            [](const MeanReversionParams& p) -> Result<void> {
                if (p.window < 2)
                    return invalid("Mean reversion window must be at least 2");
                if (p.std_multiplier <= 0.0)
                    return invalid("Mean reversion std multiplier must be positive");
                return Result<void>();
            },
            [](const MaCrossoverParams& p) -> Result<void> {
                if (p.fast < 1 || p.slow < 1)
                    return invalid("Moving average periods must be positive");
                if (p.fast >= p.slow)
                    return invalid("Fast period must be shorter than slow period");
                if (p.crossover_threshold <= 0.0 || p.crossunder_threshold <= 0.0)
                    return invalid("Crossover thresholds must be positive");
                if (p.crossunder_threshold > p.crossover_threshold)
                    return invalid("Crossunder threshold must not exceed crossover threshold");
                return Result<void>();
            },
            [](const RsiParams& p) -> Result<void> {
                if (p.period < 2)
                    return invalid("RSI period must be at least 2");
                if (p.oversold <= 0.0 || p.overbought >= 100.0 || p.oversold >= p.overbought)
                    return invalid("RSI thresholds must satisfy 0 < oversold < overbought < 100");
                return Result<void>();
            },
            [](const MacdParams& p) -> Result<void> {
                if (p.fast < 1 || p.slow < 1 || p.signal < 1)
                    return invalid("MACD periods must be positive");
                if (p.fast >= p.slow)
                    return invalid("MACD fast period must be shorter than slow period");
                return Result<void>();
            },
            [](const MomentumParams& p) -> Result<void> {
                if (p.window < 1)
                    return invalid("Momentum window must be positive");
                if (p.threshold <= 0.0)
                    return invalid("Momentum threshold must be positive");
                return Result<void>();
            },
        },
        params);
}

std::string make_strategy_id(const StrategyParams& params, Timeframe timeframe) {
    std::string body = std::visit(
        overloaded{
            [](const MeanReversionParams& p) {
                return "MR_" + std::to_string(p.window) + "_" + compact(p.std_multiplier);
            },
            [](const MaCrossoverParams& p) {
                std::string id = (p.exponential ? "EMA_" : "SMA_") + std::to_string(p.fast) + "_" +
                                 std::to_string(p.slow);
                if (p.crossover_threshold != 1.0 || p.crossunder_threshold != 1.0) {
                    id += "_" + compact(p.crossover_threshold) + "_" +
                          compact(p.crossunder_threshold);
                }
                return id;
            },
            [](const RsiParams& p) {
                return "RSI_" + std::to_string(p.period) + "_" + compact(p.oversold) + "_" +
                       compact(p.overbought);
            },
            [](const MacdParams& p) {
                return "MACD_" + std::to_string(p.fast) + "_" + std::to_string(p.slow) + "_" +
                       std::to_string(p.signal);
            },
            [](const MomentumParams& p) {
                return "MOM_" + std::to_string(p.window) + "_" + compact(p.threshold);
            },
        },
        params);
    return body + "_" + timeframe_to_string(timeframe);
}

Result<Strategy> make_strategy(const StrategyParams& params, Timeframe timeframe,
                               uint64_t discovery_seq, std::string name, int version) {
    auto valid = validate_params(params);
    if (valid.is_error()) {
        return forward_error<Strategy>(valid);
    }

    Strategy strategy;
    strategy.params = params;
    strategy.timeframe = timeframe;
    strategy.discovery_seq = discovery_seq;
    strategy.version = version;
    strategy.id = make_strategy_id(params, timeframe);
    strategy.name = name.empty() ? strategy.id : std::move(name);
    return strategy;
}

nlohmann::json params_to_json(const StrategyParams& params) {
    nlohmann::json j;
    j["family"] = strategy_family_to_string(family_of(params));
    std::visit(overloaded{
                   [&j](const MeanReversionParams& p) {
                       j["window"] = p.window;
                       j["std_multiplier"] = p.std_multiplier;
                   },
                   [&j](const MaCrossoverParams& p) {
                       j["fast"] = p.fast;
                       j["slow"] = p.slow;
                       j["exponential"] = p.exponential;
                       j["crossover_threshold"] = p.crossover_threshold;
                       j["crossunder_threshold"] = p.crossunder_threshold;
                   },
                   [&j](const RsiParams& p) {
                       j["period"] = p.period;
                       j["oversold"] = p.oversold;
                       j["overbought"] = p.overbought;
                   },
                   [&j](const MacdParams& p) {
                       j["fast"] = p.fast;
                       j["slow"] = p.slow;
                       j["signal"] = p.signal;
                   },
                   [&j](const MomentumParams& p) {
                       j["window"] = p.window;
                       j["threshold"] = p.threshold;
                   },
               },
               params);
    return j;
}

Result<StrategyParams> params_from_json(const nlohmann::json& j) {
    if (!j.contains("family")) {
        return make_error<StrategyParams>(ErrorCode::INVALID_DATA,
                                          "Strategy parameters missing family", "Strategy");
    }
    auto family = strategy_family_from_string(j.at("family").get<std::string>());
    if (!family) {
        return make_error<StrategyParams>(
            ErrorCode::INVALID_DATA,
            "Unknown strategy family: " + j.at("family").get<std::string>(), "Strategy");
    }

    try {
        switch (*family) {
            case StrategyFamily::MEAN_REVERSION: {
                MeanReversionParams p;
                p.window = j.value("window", p.window);
                p.std_multiplier = j.value("std_multiplier", p.std_multiplier);
                return StrategyParams(p);
            }
            case StrategyFamily::MA_CROSSOVER: {
                MaCrossoverParams p;
                p.fast = j.value("fast", p.fast);
                p.slow = j.value("slow", p.slow);
                p.exponential = j.value("exponential", p.exponential);
                p.crossover_threshold = j.value("crossover_threshold", p.crossover_threshold);
                p.crossunder_threshold = j.value("crossunder_threshold", p.crossunder_threshold);
                return StrategyParams(p);
            }
            case StrategyFamily::RSI: {
                RsiParams p;
                p.period = j.value("period", p.period);
                p.oversold = j.value("oversold", p.oversold);
                p.overbought = j.value("overbought", p.overbought);
                return StrategyParams(p);
            }
            case StrategyFamily::MACD: {
                MacdParams p;
                p.fast = j.value("fast", p.fast);
                p.slow = j.value("slow", p.slow);
                p.signal = j.value("signal", p.signal);
                return StrategyParams(p);
            }
            case StrategyFamily::MOMENTUM: {
                MomentumParams p;
                p.window = j.value("window", p.window);
                p.threshold = j.value("threshold", p.threshold);
                return StrategyParams(p);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<StrategyParams>(ErrorCode::JSON_PARSE_ERROR,
                                          std::string("Bad strategy parameters: ") + e.what(),
                                          "Strategy");
    }
    return make_error<StrategyParams>(ErrorCode::INVALID_DATA, "Unhandled strategy family",
                                      "Strategy");
}

nlohmann::json strategy_to_json(const Strategy& strategy) {
    nlohmann::json j;
    j["id"] = strategy.id;
    j["name"] = strategy.name;
    j["params"] = params_to_json(strategy.params);
    j["version"] = strategy.version;
    j["timeframe"] = timeframe_to_string(strategy.timeframe);
    j["discovery_seq"] = strategy.discovery_seq;
    return j;
}

Result<Strategy> strategy_from_json(const nlohmann::json& j) {
    if (!j.contains("params") || !j.contains("timeframe")) {
        return make_error<Strategy>(ErrorCode::INVALID_DATA,
                                    "Strategy JSON requires params and timeframe", "Strategy");
    }

    auto params = params_from_json(j.at("params"));
    if (params.is_error()) {
        return forward_error<Strategy>(params);
    }

    auto timeframe = timeframe_from_string(j.at("timeframe").get<std::string>());
    if (!timeframe) {
        return make_error<Strategy>(ErrorCode::INVALID_DATA,
                                    "Unknown timeframe: " + j.at("timeframe").get<std::string>(),
                                    "Strategy");
    }

    auto strategy = make_strategy(params.value(), *timeframe, j.value("discovery_seq", uint64_t{0}),
                                  j.value("name", std::string()), j.value("version", 1));
    if (strategy.is_error()) {
        return strategy;
    }

    if (j.contains("id") && j.at("id").get<std::string>() != strategy.value().id) {
        return make_error<Strategy>(ErrorCode::INVALID_DATA,
                                    "Strategy id does not match its parameters: " +
                                        j.at("id").get<std::string>(),
                                    "Strategy");
    }
    return strategy;
}

}  // namespace papertrade
