// src/engine/engine_config.cpp
#include "papertrade/engine/engine_config.hpp"
#include <stdexcept>
#include "papertrade/data/candle_aggregator.hpp"

namespace papertrade {

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["risk_profile"] = risk_profile_to_string(risk_profile);
    j["risk_overrides"] = risk_overrides;
    j["decision_loop"] = decision_loop.to_json();
    j["scheduler"] = scheduler.to_json();
    j["monitor"] = monitor.to_json();
    j["logger"] = logger.to_json();
    j["state_file"] = state_file;
    nlohmann::json data = nlohmann::json::object();
    for (const auto& [timeframe, path] : historical_data) {
        data[timeframe_to_string(timeframe)] = path;
    }
    j["historical_data"] = data;
    j["live_data_file"] = live_data_file;
    j["catalog_seed"] = catalog_seed;
    j["initial_strategy"] = initial_strategy;
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("symbol"))
        symbol = j.at("symbol").get<std::string>();
    if (j.contains("risk_profile")) {
        auto profile = risk_profile_from_string(j.at("risk_profile").get<std::string>());
        if (!profile) {
            throw std::invalid_argument("Unknown risk profile: " +
                                        j.at("risk_profile").get<std::string>());
        }
        risk_profile = *profile;
    }
    if (j.contains("risk_overrides"))
        risk_overrides = j.at("risk_overrides");
    if (j.contains("decision_loop"))
        decision_loop.from_json(j.at("decision_loop"));
    if (j.contains("scheduler"))
        scheduler.from_json(j.at("scheduler"));
    if (j.contains("monitor"))
        monitor.from_json(j.at("monitor"));
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("state_file"))
        state_file = j.at("state_file").get<std::string>();
    if (j.contains("historical_data")) {
        historical_data.clear();
        for (const auto& [key, value] : j.at("historical_data").items()) {
            auto timeframe = timeframe_from_string(key);
            if (!timeframe) {
                throw std::invalid_argument("Unknown timeframe in historical_data: " + key);
            }
            historical_data[*timeframe] = value.get<std::string>();
        }
    }
    if (j.contains("live_data_file"))
        live_data_file = j.at("live_data_file").get<std::string>();
    if (j.contains("catalog_seed"))
        catalog_seed = j.at("catalog_seed").get<uint64_t>();
    if (j.contains("initial_strategy"))
        initial_strategy = j.at("initial_strategy");
}

RiskPolicy EngineConfig::resolved_policy() const {
    RiskPolicy policy = risk_policy_for(risk_profile);
    if (risk_overrides.is_object() && !risk_overrides.empty()) {
        policy.from_json(risk_overrides);
    }
    return policy;
}

Result<std::optional<Strategy>> EngineConfig::resolved_initial_strategy() const {
    if (initial_strategy.is_null()) {
        return std::optional<Strategy>();
    }
    try {
        auto strategy = strategy_from_json(initial_strategy);
        if (strategy.is_error()) {
            return forward_error<std::optional<Strategy>>(strategy);
        }
        return std::optional<Strategy>(strategy.take_value());
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::optional<Strategy>>(
            ErrorCode::INVALID_CONFIGURATION,
            std::string("Malformed initial_strategy: ") + e.what(), "EngineConfig");
    }
}

Result<void> EngineConfig::validate() const {
    if (symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, "symbol cannot be empty",
                                "EngineConfig");
    }
    if (!risk_overrides.is_object()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "risk_overrides must be an object", "EngineConfig");
    }

    RiskPolicy policy;
    try {
        policy = resolved_policy();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                std::string("Invalid risk_overrides: ") + e.what(), "EngineConfig");
    }

    auto policy_result = validate_policy(policy);
    if (policy_result.is_error()) {
        return policy_result;
    }
    auto loop_result = decision_loop.validate();
    if (loop_result.is_error()) {
        return loop_result;
    }
    auto scheduler_result = scheduler.validate();
    if (scheduler_result.is_error()) {
        return scheduler_result;
    }
    for (Timeframe tf : scheduler.timeframes) {
        if (!CandleAggregator::can_aggregate(decision_loop.timeframe, tf)) {
            return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                    "Scheduler timeframe " + timeframe_to_string(tf) +
                                        " cannot be built from " +
                                        timeframe_to_string(decision_loop.timeframe) +
                                        " live samples",
                                    "EngineConfig");
        }
    }

    auto initial = resolved_initial_strategy();
    if (initial.is_error()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                std::string("Invalid initial_strategy: ") + initial.error()->what(),
                                "EngineConfig");
    }
    if (initial.value() &&
        !CandleAggregator::can_aggregate(decision_loop.timeframe, initial.value()->timeframe)) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "initial_strategy timeframe " +
                                    timeframe_to_string(initial.value()->timeframe) +
                                    " cannot be built from live samples",
                                "EngineConfig");
    }

    auto monitor_result = monitor.validate();
    if (monitor_result.is_error()) {
        return monitor_result;
    }
    return logger.validate();
}

}  // namespace papertrade
