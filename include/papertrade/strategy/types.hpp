// include/papertrade/strategy/types.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"

namespace papertrade {

/**
 * @brief Strategy families understood by the signal evaluator
 */
enum class StrategyFamily { MEAN_REVERSION, MA_CROSSOVER, RSI, MACD, MOMENTUM };

std::string strategy_family_to_string(StrategyFamily family);
std::optional<StrategyFamily> strategy_family_from_string(const std::string& s);

/**
 * @brief Bollinger-style band reversion
 * LONG below mean - k*sigma, SHORT above mean + k*sigma
 */
struct MeanReversionParams {
    int window{20};
    double std_multiplier{2.0};
};

/**
 * @brief Fast/slow moving average crossover with sensitivity thresholds
 * LONG when fast crosses above slow*crossover_threshold, SHORT when it
 * crosses below slow*crossunder_threshold
 */
struct MaCrossoverParams {
    int fast{10};
    int slow{30};
    bool exponential{false};
    double crossover_threshold{1.0};
    double crossunder_threshold{1.0};
};

struct RsiParams {
    int period{14};
    double oversold{30.0};
    double overbought{70.0};
};

/**
 * @brief MACD line (EMA fast - EMA slow) against its signal line
 */
struct MacdParams {
    int fast{12};
    int slow{26};
    int signal{9};
};

/**
 * @brief Return over the window beyond +/- threshold
 */
struct MomentumParams {
    int window{10};
    double threshold{0.02};
};

using StrategyParams =
    std::variant<MeanReversionParams, MaCrossoverParams, RsiParams, MacdParams, MomentumParams>;

StrategyFamily family_of(const StrategyParams& params);

/**
 * @brief Check a parameter set for usable values
 * @return INVALID_ARGUMENT describing the first bad parameter
 */
Result<void> validate_params(const StrategyParams& params);

/**
 * @brief Deterministic identifier from family, parameters and timeframe
 * e.g. "RSI_14_30_70_5m"
 */
std::string make_strategy_id(const StrategyParams& params, Timeframe timeframe);

/**
 * @brief Immutable trading rule with its parameter set
 *
 * A different parameter combination is a different strategy with a
 * different id. discovery_seq orders strategies by the moment they entered
 * the population and breaks ranking ties.
 */
struct Strategy {
    std::string id;
    std::string name;
    StrategyParams params;
    int version{1};
    Timeframe timeframe{Timeframe::MINUTE_5};
    uint64_t discovery_seq{0};

    StrategyFamily family() const {
        return family_of(params);
    }
};

/**
 * @brief Build a validated strategy, deriving its id
 * @param name Human readable label, defaults to the id
 */
Result<Strategy> make_strategy(const StrategyParams& params, Timeframe timeframe,
                               uint64_t discovery_seq = 0, std::string name = "",
                               int version = 1);

nlohmann::json params_to_json(const StrategyParams& params);
Result<StrategyParams> params_from_json(const nlohmann::json& j);

nlohmann::json strategy_to_json(const Strategy& strategy);
Result<Strategy> strategy_from_json(const nlohmann::json& j);

}  // namespace papertrade
