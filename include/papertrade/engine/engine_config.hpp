// include/papertrade/engine/engine_config.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "papertrade/core/config_base.hpp"
#include "papertrade/core/logger.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/live/decision_loop.hpp"
#include "papertrade/monitor/performance_monitor.hpp"
#include "papertrade/optimization/optimization_scheduler.hpp"
#include "papertrade/risk/risk_manager.hpp"
#include "papertrade/strategy/types.hpp"

namespace papertrade {

/**
 * @brief Top-level configuration of a paper trading engine
 *
 * Example:
 * {
 *   "symbol": "BTCUSDT",
 *   "risk_profile": "CONSERVATIVE",
 *   "risk_overrides": {"fee_rate": 0.001},
 *   "decision_loop": {"timeframe": "1s", "tick_interval": 1.0},
 *   "scheduler": {"timeframes": ["5m", "15m"], "optimization_period": 600},
 *   "historical_data": {"5m": "data/BTCUSDT_5m.csv", "15m": "data/BTCUSDT_15m.csv"},
 *   "initial_strategy": {"timeframe": "5m", "params": {"family": "RSI", "period": 14}},
 *   "state_file": "state/engine_state.json"
 * }
 */
struct EngineConfig : public ConfigBase {
    std::string symbol{"BTCUSDT"};
    RiskProfile risk_profile{RiskProfile::DEFAULT};
    nlohmann::json risk_overrides = nlohmann::json::object();  // RiskPolicy keys over the preset
    DecisionLoopConfig decision_loop;
    SchedulerConfig scheduler;
    MonitorConfig monitor;
    LoggerConfig logger;
    std::string state_file;                              // empty disables persistence
    std::map<Timeframe, std::string> historical_data;    // CSV file per timeframe
    std::string live_data_file;                          // CSV replayed as live samples
    uint64_t catalog_seed{42};
    nlohmann::json initial_strategy;  // strategy traded before the first promotion, null for none

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Validate every section and the resolved risk policy
     *
     * Every timeframe the scheduler ranks, and the initial strategy's, must
     * be buildable from the decision loop's live samples.
     * @return INVALID_CONFIGURATION naming the first bad section
     */
    Result<void> validate() const override;

    /**
     * @brief Preset of risk_profile with risk_overrides applied
     */
    RiskPolicy resolved_policy() const;

    /**
     * @return The parsed initial strategy, nullopt when none is configured,
     * or the parse error
     */
    Result<std::optional<Strategy>> resolved_initial_strategy() const;
};

}  // namespace papertrade
