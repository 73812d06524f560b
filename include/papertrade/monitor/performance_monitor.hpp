// include/papertrade/monitor/performance_monitor.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "papertrade/core/config_base.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/live/active_strategy_slot.hpp"

namespace papertrade {

struct MonitorConfig : public ConfigBase {
    double alert_threshold{0.02};  // absolute return gap that raises an alert
    size_t max_samples{100000};    // live points kept per activation

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Live versus backtest comparison for the active strategy
 */
struct DivergenceReport {
    std::string strategy_id;
    size_t samples{0};
    double live_return{0.0};
    double expected_return{0.0};
    double deviation{0.0};             // live - expected
    double normalized_deviation{0.0};  // |deviation| / |expected|, floored denominator
    double live_win_rate{0.0};
    double expected_win_rate{0.0};
    double accuracy_score{0.0};        // [0, 1]
    std::string confidence_level;      // HIGH, MEDIUM or LOW
    bool alert{false};
    Timestamp as_of;

    nlohmann::json to_json() const;
};

/**
 * @brief Tracks how the live equity curve diverges from the backtest that
 * justified the active strategy
 *
 * Read-only with respect to the ledger and the scheduler: it only sees
 * values handed to it by the decision loop.
 */
class PerformanceMonitor {
public:
    explicit PerformanceMonitor(MonitorConfig config = {});

    /**
     * @brief Start a new comparison for a newly activated strategy
     */
    void on_strategy_activated(const ActiveStrategy& active);

    void record(const Timestamp& ts, double equity);
    void record_trade(const Trade& trade);

    /**
     * @brief Compare live and backtest returns over the same elapsed time
     *
     * The live return runs from activation to the latest point. The
     * expected return is read off the backtest curve at the same distance
     * from its start, interpolated between candles, so live points of any
     * timeframe compare against a curve of any other.
     * @return nullopt until two live samples exist for an active strategy
     */
    std::optional<DivergenceReport> divergence() const;

    size_t sample_count() const;

    static std::string confidence_for(double accuracy_score);

private:
    MonitorConfig config_;
    std::string strategy_id_;
    std::vector<EquityPoint> backtest_curve_;
    double expected_win_rate_{0.0};
    std::vector<EquityPoint> live_curve_;
    int live_trades_{0};
    int live_wins_{0};
    mutable std::mutex mutex_;
};

}  // namespace papertrade
