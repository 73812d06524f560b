// include/papertrade/optimization/optimization_scheduler.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "papertrade/core/config_base.hpp"
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/data/market_data_feed.hpp"
#include "papertrade/live/active_strategy_slot.hpp"
#include "papertrade/live/decision_loop.hpp"
#include "papertrade/optimization/strategy_optimizer.hpp"
#include "papertrade/strategy/strategy_catalog.hpp"

namespace papertrade {

struct SchedulerConfig : public ConfigBase {
    double optimization_period{600.0};  // seconds between re-ranking cycles
    double discovery_period{1800.0};    // seconds between discovery cycles
    double promotion_threshold{0.75};
    std::vector<Timeframe> timeframes{Timeframe::MINUTE_5};  // historical timeframes backtested
    size_t backtest_samples{0};  // most recent samples replayed per timeframe, 0 for all
    size_t perturbations_per_strategy{3};      // variants per winner in discovery
    size_t history_size{50};                   // cycle reports and deployments kept
    std::string results_dir;                   // empty disables result files
    OptimizerConfig optimizer;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief What one optimization cycle did
 */
struct CycleReport {
    uint64_t cycle{0};
    bool discovery{false};
    Timestamp started_at;
    double duration_ms{0.0};
    size_t samples{0};  // across all timeframes
    std::vector<Timeframe> timeframes;  // timeframes that had history
    size_t evaluated{0};
    size_t failed{0};
    std::vector<std::pair<std::string, double>> winners;  // id, score
    std::optional<std::string> promoted_id;
    std::string active_id;
    double active_score{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief One replacement of the active strategy
 */
struct DeploymentRecord {
    std::string strategy_id;
    double score{0.0};
    std::string replaced_id;  // empty when the slot was empty
    double replaced_score{0.0};
    Timestamp deployed_at;

    nlohmann::json to_json() const;
    static DeploymentRecord from_json(const nlohmann::json& j);
};

/**
 * @brief Periodically re-ranks the strategy population and promotes winners
 *
 * Runs on its own thread, independent of the decision loop; the only state
 * the two share is the active strategy slot. Cycles never overlap: a cycle
 * requested while another is running is skipped and counted. A discovery
 * cycle also evaluates perturbations of the current winners and of the
 * active strategy. Each candidate is backtested on the history of its own
 * timeframe; a configured timeframe without history is skipped for the
 * cycle.
 */
class OptimizationScheduler {
public:
    OptimizationScheduler(SchedulerConfig config, std::shared_ptr<MarketDataFeed> feed,
                          std::shared_ptr<ActiveStrategySlot> strategy_slot,
                          std::shared_ptr<RiskManagerSlot> risk_slot,
                          std::shared_ptr<StrategyCatalog> catalog,
                          std::vector<Strategy> base_population);

    ~OptimizationScheduler();

    OptimizationScheduler(const OptimizationScheduler&) = delete;
    OptimizationScheduler& operator=(const OptimizationScheduler&) = delete;

    /**
     * @brief Run one cycle on the calling thread
     * @param discovery Add perturbed candidates before ranking
     * @return The cycle report, CYCLE_IN_PROGRESS if another cycle is
     * running, or DATA_NOT_FOUND when no configured timeframe has history
     */
    Result<CycleReport> run_cycle(bool discovery);

    /**
     * @brief Replace the active strategy if the candidate is better
     *
     * Promotes only when the candidate's score exceeds the promotion
     * threshold and, if a strategy is active, that strategy's latest score.
     * The threshold applies to an empty slot too.
     * @return PROMOTION_REJECTED when the candidate does not qualify or
     * another writer changed the slot first
     */
    Result<void> try_promote(const ScoredStrategy& candidate);

    /**
     * @brief try_promote against the slot value the caller decided on
     */
    Result<void> try_promote(const ScoredStrategy& candidate,
                             std::shared_ptr<const ActiveStrategy> expected);

    /**
     * @brief Start periodic cycles on a worker thread, the first immediately
     * @return ALREADY_RUNNING if the worker is active
     */
    Result<void> start();
    void stop();

    bool is_running() const {
        return running_.load();
    }

    bool cycle_in_progress() const {
        return cycle_running_.load();
    }

    uint64_t cycles_completed() const {
        return cycles_.load();
    }

    uint64_t skipped_triggers() const {
        return skipped_.load();
    }

    uint64_t promotions() const {
        return promotions_.load();
    }

    std::vector<CycleReport> history() const;
    std::vector<ScoredStrategy> winners() const;
    std::vector<DeploymentRecord> deployments() const;
    std::vector<Strategy> population() const;

    /**
     * @brief Seed winners and deployment history saved by an earlier run
     */
    void restore(std::vector<ScoredStrategy> winners, std::vector<DeploymentRecord> deployments);

    const std::string& component_id() const {
        return component_id_;
    }

private:
    void run();
    Result<CycleReport> execute_cycle(bool discovery);
    std::shared_ptr<const ActiveStrategy> refresh_active(const OptimizationResult& result);
    std::vector<Strategy> build_population(bool discovery);
    void record(const CycleReport& report);
    void record(DeploymentRecord deployment);
    void write_report(const CycleReport& report, const OptimizationResult& result) const;

    SchedulerConfig config_;
    std::shared_ptr<MarketDataFeed> feed_;
    std::shared_ptr<ActiveStrategySlot> strategy_slot_;
    std::shared_ptr<RiskManagerSlot> risk_slot_;
    std::shared_ptr<StrategyCatalog> catalog_;
    std::vector<Strategy> base_population_;
    std::string component_id_;

    mutable std::mutex data_mutex_;  // guards winners_, history_, deployments_
    std::vector<ScoredStrategy> winners_;
    std::deque<CycleReport> history_;
    std::deque<DeploymentRecord> deployments_;

    std::atomic<bool> cycle_running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> promotions_{0};

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace papertrade
