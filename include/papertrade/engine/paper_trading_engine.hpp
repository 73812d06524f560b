// include/papertrade/engine/paper_trading_engine.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/data/market_data_feed.hpp"
#include "papertrade/engine/engine_config.hpp"
#include "papertrade/engine/state_store.hpp"
#include "papertrade/live/active_strategy_slot.hpp"
#include "papertrade/live/decision_loop.hpp"
#include "papertrade/monitor/performance_monitor.hpp"
#include "papertrade/optimization/optimization_scheduler.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"
#include "papertrade/strategy/strategy_catalog.hpp"

namespace papertrade {

/**
 * @brief Point-in-time view of the whole engine
 */
struct EngineStatus {
    bool running{false};
    Portfolio portfolio;  // without the equity curve
    double equity{0.0};
    std::string active_strategy_id;
    double active_score{0.0};
    Signal last_signal;
    std::chrono::milliseconds uptime{0};
    LoopCounters counters;
    uint64_t cycles_completed{0};
    uint64_t skipped_cycles{0};
    uint64_t promotions{0};
    RiskProfile risk_profile{RiskProfile::DEFAULT};
    std::optional<DivergenceReport> divergence;
    bool healthy{false};  // no registered component in ERR_STATE
    std::vector<std::pair<std::string, std::string>> components;  // id, state

    nlohmann::json to_json() const;
};

/**
 * @brief Control surface tying the decision loop, the optimization
 * scheduler and the performance monitor to one ledger
 *
 * Usage:
 *   PaperTradingEngine engine(config, feed);
 *   auto init = engine.initialize();   // INVALID_CONFIGURATION is fatal
 *   engine.start();
 *   ...
 *   engine.stop();                     // saves state when state_file is set
 */
class PaperTradingEngine {
public:
    PaperTradingEngine(EngineConfig config, std::shared_ptr<MarketDataFeed> feed);
    ~PaperTradingEngine();

    PaperTradingEngine(const PaperTradingEngine&) = delete;
    PaperTradingEngine& operator=(const PaperTradingEngine&) = delete;

    /**
     * @brief Validate the configuration and build all components
     *
     * Restores the saved state when state_file exists.
     * @return INVALID_CONFIGURATION for malformed configuration, or the
     * state store's error for a damaged state file
     */
    Result<void> initialize();

    /**
     * @return NOT_INITIALIZED before initialize(), ALREADY_RUNNING if started
     */
    Result<void> start();

    /**
     * @brief Stop both workers and save state when persistence is enabled
     */
    Result<void> stop();

    EngineStatus status() const;

    /**
     * @brief Switch to a preset risk profile
     *
     * The new limits apply from the next tick. The profile's starting
     * balance is applied only while the ledger has no history.
     */
    Result<void> select_risk_profile(RiskProfile profile);

    Result<void> save_state() const;

    /**
     * @brief Replace ledger, active strategy and profile with the saved ones
     * @return INVALID_STATE_TRANSITION while running
     */
    Result<void> load_state();

    bool is_initialized() const {
        return initialized_.load();
    }

    bool is_running() const {
        return running_.load();
    }

    // Components, valid after initialize()
    DecisionLoop& decision_loop() {
        return *loop_;
    }
    OptimizationScheduler& scheduler() {
        return *scheduler_;
    }
    PortfolioLedger& ledger() {
        return *ledger_;
    }
    PerformanceMonitor& monitor() {
        return *monitor_;
    }
    ActiveStrategySlot& strategy_slot() {
        return *strategy_slot_;
    }

    const EngineConfig& get_config() const {
        return config_;
    }

private:
    Result<void> build_components(const std::optional<EngineState>& restored);
    EngineState capture_state() const;

    EngineConfig config_;
    std::shared_ptr<MarketDataFeed> feed_;
    std::string component_id_;

    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<ActiveStrategySlot> strategy_slot_;
    std::shared_ptr<RiskManagerSlot> risk_slot_;
    std::shared_ptr<PerformanceMonitor> monitor_;
    std::shared_ptr<StrategyCatalog> catalog_;
    std::unique_ptr<DecisionLoop> loop_;
    std::unique_ptr<OptimizationScheduler> scheduler_;

    std::atomic<RiskProfile> risk_profile_{RiskProfile::DEFAULT};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    mutable std::mutex control_mutex_;  // serializes start, stop, load and profile changes
};

}  // namespace papertrade
